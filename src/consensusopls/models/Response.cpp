// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Response.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include <fmt/core.h>

#include "../utils/Errors.h"

namespace ConsensusOPLS {

ModelType parseModelType(const std::string &tag) {
    if (tag == "reg" || tag == "regression") return ModelType::Regression;
    if (tag == "da" || tag == "discriminant") return ModelType::Discriminant;
    throw InputValidationError(fmt::format("modelType must be 'reg' or 'da', got '{}'", tag));
}

std::string modelTypeName(ModelType type) {
    return type == ModelType::Regression ? "reg" : "da";
}

Response Response::fromMatrix(Eigen::MatrixXd Y) {
    Response r;
    r.matrix_ = std::move(Y);
    return r;
}

Response Response::fromVector(const Eigen::VectorXd &y) {
    Response r;
    r.matrix_ = y;
    return r;
}

Response Response::fromLabels(std::vector<std::string> labels) {
    Response r;
    r.labels_ = std::move(labels);
    return r;
}

int Response::rows() const {
    return hasLabels() ? static_cast<int>(labels_.size()) : static_cast<int>(matrix_.rows());
}

CodedResponse dummyCode(const std::vector<std::string> &labels) {
    std::set<std::string> distinct(labels.begin(), labels.end());
    CodedResponse coded;
    coded.type = ModelType::Discriminant;
    coded.class_names.assign(distinct.begin(), distinct.end());

    const int n = labels.size();
    coded.Y = Eigen::MatrixXd::Zero(n, coded.class_names.size());
    coded.classes.resize(n);
    for (int i = 0; i < n; i++) {
        auto it = std::lower_bound(coded.class_names.begin(), coded.class_names.end(), labels[i]);
        int k = it - coded.class_names.begin();
        coded.Y(i, k) = 1.0;
        coded.classes[i] = k;
    }
    return coded;
}

std::vector<int> argMaxClasses(const Eigen::MatrixXd &Y) {
    std::vector<int> classes(Y.rows());
    for (int i = 0; i < Y.rows(); i++) {
        Eigen::Index k = 0;
        Y.row(i).maxCoeff(&k);
        classes[i] = k;
    }
    return classes;
}

namespace {

// Numeric one-column discriminant responses are treated as labels; format
// integers without a trailing ".0" so class names read naturally.
std::string numericLabel(double v) {
    if (std::floor(v) == v && std::abs(v) < 1e15) return fmt::format("{}", static_cast<long long>(v));
    return fmt::format("{}", v);
}

bool isIndicatorMatrix(const Eigen::MatrixXd &Y) {
    for (int i = 0; i < Y.rows(); i++) {
        int ones = 0;
        for (int j = 0; j < Y.cols(); j++) {
            if (Y(i, j) == 1.0) ones++;
            else if (Y(i, j) != 0.0) return false;
        }
        if (ones != 1) return false;
    }
    return true;
}

} // namespace

CodedResponse codeResponse(const Response &response, ModelType type) {
    if (response.rows() == 0) {
        throw InputValidationError("Response has no rows");
    }

    if (type == ModelType::Regression) {
        if (response.hasLabels()) {
            throw InputValidationError("Class labels require modelType 'da'");
        }
        const Eigen::MatrixXd &Y = response.matrix();
        if (Y.cols() == 0) throw InputValidationError("Response has no columns");
        if (!Y.allFinite()) throw InputValidationError("Response contains non-finite values");
        CodedResponse coded;
        coded.type = ModelType::Regression;
        coded.Y = Y;
        return coded;
    }

    CodedResponse coded;
    if (response.hasLabels()) {
        coded = dummyCode(response.labels());
    } else {
        const Eigen::MatrixXd &Y = response.matrix();
        if (Y.cols() == 0) throw InputValidationError("Response has no columns");
        if (!Y.allFinite()) throw InputValidationError("Response contains non-finite values");
        if (Y.cols() == 1) {
            std::vector<std::string> labels(Y.rows());
            for (int i = 0; i < Y.rows(); i++) labels[i] = numericLabel(Y(i, 0));
            coded = dummyCode(labels);
        } else {
            if (!isIndicatorMatrix(Y)) {
                throw InputValidationError(
                    "A multi-column discriminant response must be a 0/1 indicator matrix with one 1 per row"
                );
            }
            coded.type = ModelType::Discriminant;
            coded.Y = Y;
            coded.classes = argMaxClasses(Y);
            for (int j = 0; j < Y.cols(); j++) coded.class_names.push_back(std::to_string(j + 1));
        }
    }

    const int nclass = coded.Y.cols();
    if (nclass < 2) {
        throw InputValidationError("A discriminant response needs at least two classes; use modelType 'reg'");
    }
    Eigen::VectorXd counts = coded.Y.colwise().sum().transpose();
    for (int j = 0; j < nclass; j++) {
        if (counts(j) < 2) {
            throw InputValidationError(fmt::format(
                "Class '{}' has {} sample(s); every class needs at least two samples for modelType 'da'",
                coded.class_names[j], static_cast<int>(counts(j))
            ));
        }
    }
    return coded;
}

CodedResponse permuteRows(const CodedResponse &response, const std::vector<int> &order) {
    CodedResponse out = response;
    for (int i = 0; i < static_cast<int>(order.size()); i++) {
        out.Y.row(i) = response.Y.row(order[i]);
        if (!response.classes.empty()) out.classes[i] = response.classes[order[i]];
    }
    return out;
}

} // namespace ConsensusOPLS
