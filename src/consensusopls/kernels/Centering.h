// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <string>

#include <Eigen/Core>

namespace ConsensusOPLS {

// Kernel centering in feature space, with H = I - 11'/n_train.

// H K H
Eigen::MatrixXd centerTrainKernel(const Eigen::MatrixXd &KtrTr);

// (KteTr - 1 1' KtrTr / n_train) H
Eigen::MatrixXd centerTestKernel(const Eigen::MatrixXd &KteTr, const Eigen::MatrixXd &KtrTr);

enum class Scaling {
    None,         // no change
    Center,       // subtract column means
    UnitVariance, // center, divide by column standard deviation
    Pareto        // center, divide by sqrt of column standard deviation
};

// Accepts "no", "mc", "uv", "pa" and the enum names in lower case.
// Throws InputValidationError otherwise.
Scaling parseScaling(const std::string &tag);
std::string scalingName(Scaling scaling);

struct ScaleParams {
    Scaling scaling = Scaling::None;
    Eigen::VectorXd means;  // c × 1, zeros when not centered
    Eigen::VectorXd scales; // c × 1, ones when not scaled
};

struct ScaledMatrix {
    Eigen::MatrixXd X;
    ScaleParams params;
};

// Scale the columns of X. Constant columns keep a scale of 1.
ScaledMatrix scaleColumns(const Eigen::MatrixXd &X, Scaling scaling);

// Apply previously estimated parameters to new rows.
Eigen::MatrixXd applyScaling(const Eigen::MatrixXd &X, const ScaleParams &params);

// Undo scaling: X * diag(scales) + 1 means'.
Eigen::MatrixXd rescaleColumns(const Eigen::MatrixXd &X, const ScaleParams &params);

} // namespace ConsensusOPLS
