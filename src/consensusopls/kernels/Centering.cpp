// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Centering.h"

#include <cmath>

#include <fmt/core.h>

#include "../utils/Errors.h"

namespace ConsensusOPLS {

Eigen::MatrixXd centerTrainKernel(const Eigen::MatrixXd &KtrTr) {
    // H K H = K - r 1' - 1 c' + mu, with r/c the row/column means and mu the
    // grand mean; avoids forming H explicitly.
    const int n = KtrTr.rows();
    Eigen::VectorXd row_means = KtrTr.rowwise().mean();
    Eigen::RowVectorXd col_means = KtrTr.colwise().mean();
    const double mu = KtrTr.sum() / (static_cast<double>(n) * n);
    Eigen::MatrixXd Kc = KtrTr;
    Kc.colwise() -= row_means;
    Kc.rowwise() -= col_means;
    Kc.array() += mu;
    return Kc;
}

Eigen::MatrixXd centerTestKernel(const Eigen::MatrixXd &KteTr, const Eigen::MatrixXd &KtrTr) {
    // (KteTr - 1 c') H where c' are the column means of KtrTr; right
    // multiplication by H subtracts row means.
    Eigen::RowVectorXd train_col_means = KtrTr.colwise().mean();
    Eigen::MatrixXd Kc = KteTr;
    Kc.rowwise() -= train_col_means;
    Eigen::VectorXd row_means = Kc.rowwise().mean();
    Kc.colwise() -= row_means;
    return Kc;
}

Scaling parseScaling(const std::string &tag) {
    if (tag == "no" || tag == "none") return Scaling::None;
    if (tag == "mc" || tag == "center") return Scaling::Center;
    if (tag == "uv" || tag == "unit_variance") return Scaling::UnitVariance;
    if (tag == "pa" || tag == "pareto") return Scaling::Pareto;
    throw InputValidationError(fmt::format(
        "Unknown scaling '{}': expected no, mc, uv or pa", tag
    ));
}

std::string scalingName(Scaling scaling) {
    switch (scaling) {
    case Scaling::None: return "none";
    case Scaling::Center: return "center";
    case Scaling::UnitVariance: return "unit_variance";
    case Scaling::Pareto: return "pareto";
    }
    return "none";
}

ScaledMatrix scaleColumns(const Eigen::MatrixXd &X, Scaling scaling) {
    ScaledMatrix result;
    const int n = X.rows();
    const int c = X.cols();
    result.params.scaling = scaling;
    result.params.means = Eigen::VectorXd::Zero(c);
    result.params.scales = Eigen::VectorXd::Ones(c);

    if (scaling != Scaling::None) {
        result.params.means = X.colwise().mean().transpose();
    }
    if ((scaling == Scaling::UnitVariance || scaling == Scaling::Pareto) && n > 1) {
        for (int j = 0; j < c; j++) {
            double ss = (X.col(j).array() - result.params.means(j)).square().sum();
            double sd = std::sqrt(ss / (n - 1));
            if (!(sd > 0)) continue;
            result.params.scales(j) = scaling == Scaling::Pareto ? std::sqrt(sd) : sd;
        }
    }
    result.X = applyScaling(X, result.params);
    return result;
}

Eigen::MatrixXd applyScaling(const Eigen::MatrixXd &X, const ScaleParams &params) {
    Eigen::MatrixXd out = X;
    out.rowwise() -= params.means.transpose();
    out.array().rowwise() /= params.scales.transpose().array();
    return out;
}

Eigen::MatrixXd rescaleColumns(const Eigen::MatrixXd &X, const ScaleParams &params) {
    Eigen::MatrixXd out = X;
    out.array().rowwise() *= params.scales.transpose().array();
    out.rowwise() += params.means.transpose();
    return out;
}

} // namespace ConsensusOPLS
