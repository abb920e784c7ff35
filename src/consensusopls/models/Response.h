// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <string>
#include <vector>

#include <Eigen/Core>

namespace ConsensusOPLS {

// One data table; rows are samples shared by every block of a fit.
struct DataBlock {
    std::string name;
    Eigen::MatrixXd X;                       // n × p
    std::vector<std::string> variable_names; // p names, or empty
};

enum class ModelType { Regression, Discriminant };

// Accepts "reg"/"regression" and "da"/"discriminant".
ModelType parseModelType(const std::string &tag);
std::string modelTypeName(ModelType type);

// Response as supplied by the caller: a numeric matrix or class labels.
class Response {
  public:
    static Response fromMatrix(Eigen::MatrixXd Y);
    static Response fromVector(const Eigen::VectorXd &y);
    static Response fromLabels(std::vector<std::string> labels);

    int rows() const;
    bool hasLabels() const { return !labels_.empty(); }
    const Eigen::MatrixXd &matrix() const { return matrix_; }
    const std::vector<std::string> &labels() const { return labels_; }

  private:
    Eigen::MatrixXd matrix_;
    std::vector<std::string> labels_;
};

// Response matrix ready for modeling. For discriminant models Y is an
// n × c indicator matrix whose columns follow class_names.
struct CodedResponse {
    ModelType type;
    Eigen::MatrixXd Y;
    std::vector<std::string> class_names; // empty for regression
    std::vector<int> classes;             // per-sample class index, empty for regression
};

// Dummy-code labels; columns follow the sorted distinct labels.
CodedResponse dummyCode(const std::vector<std::string> &labels);

// Class index per row: arg-max over the columns of Y (first maximum wins).
std::vector<int> argMaxClasses(const Eigen::MatrixXd &Y);

// Validate and code a response for the requested model type. Throws
// InputValidationError on shape problems, on a discriminant response with
// fewer than two classes, or with a class holding fewer than two samples.
CodedResponse codeResponse(const Response &response, ModelType type);

// Reorder rows: out.row(i) = Y.row(order[i]).
CodedResponse permuteRows(const CodedResponse &response, const std::vector<int> &order);

} // namespace ConsensusOPLS
