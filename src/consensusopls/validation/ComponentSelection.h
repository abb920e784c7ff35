// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <vector>

#include <Eigen/Core>

#include "../models/Response.h"
#include "CrossValidation.h"

namespace ConsensusOPLS {

// Minimum gain in the selection curve needed to add an orthogonal component.
constexpr double kSelectionImprovement = 0.01;

struct DQ2Value {
    double dq2;
    double pressd;
};

// Discriminant Q2 (Westerhuis et al., 2008) for one 0/1 response column.
// Residuals of class-0 rows count only when the prediction is above 0, and
// of class-1 rows only when it is below 1. Rows with a non-finite
// prediction are skipped; NaN when nothing is left.
DQ2Value dq2Statistic(const Eigen::VectorXd &yhat, const Eigen::VectorXd &y);

// Greedy stopping rule over curve(k), k = 0..max_ocomp. Starts at k = 1
// (k = 0 when max_ocomp = 0 or curve(1) is NaN) and advances while
// curve(k+1) - curve(k) exceeds kSelectionImprovement. NaN values stop
// the search.
int selectOrthogonalCount(const Eigen::VectorXd &curve, int max_ocomp);

struct ClassificationStats {
    Eigen::MatrixXi confusion;   // c × c, rows = observed class, cols = predicted class
    Eigen::VectorXd sensitivity; // c × 1
    Eigen::VectorXd specificity; // c × 1
    double mean_sensitivity;
    double mean_specificity;
    int n_excluded;              // rows without a finite prediction
};

// Per-class sensitivity and specificity. pred entries < 0 mark rows
// without a prediction.
ClassificationStats classificationStats(const std::vector<int> &truth, const std::vector<int> &pred, int nclass);

struct SelectionResult {
    Eigen::VectorXd curve;   // (max_ocomp+1) × 1, DQ2 mean (discriminant) or Q2Yhat (regression)
    Eigen::MatrixXd dq2;     // (max_ocomp+1) × c, discriminant only
    Eigen::MatrixXd pressd;  // (max_ocomp+1) × c, discriminant only
    int n_ocomp;
    ClassificationStats cv_classification; // discriminant only, at n_ocomp
};

// Build the selection curve from cross-validated predictions and apply the
// stopping rule. DQ2 cells run over k (outer) and response columns (inner)
// with the worker budget split by splitWorkers().
SelectionResult selectComponents(const CVResult &cv, ModelType type, int n_workers);

} // namespace ConsensusOPLS
