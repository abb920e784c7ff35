// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include <catch2/catch.hpp>

#include <cmath>

#include <Eigen/Core>

#include "TestData.h"
#include "consensusopls/kernels/Kernel.h"
#include "consensusopls/models/KernelOPLS.h"
#include "consensusopls/utils/Errors.h"

using namespace ConsensusOPLS;
using ConsensusOPLS::testing::normalMatrix;

namespace {

struct RegressionProblem {
    Eigen::MatrixXd X;
    Eigen::MatrixXd K;
    Eigen::MatrixXd Y;
};

RegressionProblem regressionProblem() {
    RegressionProblem p;
    p.X = normalMatrix(30, 8, 101);
    p.K = buildKernel(KernelSpec(LinearKernel{}), p.X);
    p.Y = p.X.col(0) + 0.05 * normalMatrix(30, 1, 102);
    return p;
}

} // namespace

TEST_CASE("Kernel OPLS fit", "[kopls]") {
    RegressionProblem p = regressionProblem();
    KernelOPLSModel model = kernelopls(p.K, p.Y, 1, 2);

    REQUIRE(model.ncomp == 1);
    REQUIRE(model.nox == 2);
    REQUIRE(model.Tp.size() == 3);
    REQUIRE(model.K_first.size() == 3);
    REQUIRE(model.K_diag.size() == 3);
    REQUIRE(model.scoresP().rows() == 30);
    REQUIRE(model.scoresO().cols() == 2);
    REQUIRE(model.fitted_values.rows() == 30);

    // Orthogonal scores are orthonormal
    Eigen::MatrixXd G = model.To.transpose() * model.To;
    REQUIRE((G - Eigen::MatrixXd::Identity(2, 2)).norm() < 1e-8);

    REQUIRE(model.R2Yhat.size() == 3);
    REQUIRE(model.R2Yhat(0) > 0.5);
    REQUIRE(model.R2Y <= 1.0);
    for (int i = 0; i <= 2; i++) {
        REQUIRE(model.R2Yhat(i) <= 1.0);
        REQUIRE(model.R2XC(i) == Approx(model.R2X(i) - model.R2XO(i)));
    }
    REQUIRE(model.R2XO(0) == Approx(0.0).margin(1e-12));
    REQUIRE(model.R2XO(2) > model.R2XO(1));
}

TEST_CASE("Predicting the training kernel reproduces the fit", "[kopls]") {
    RegressionProblem p = regressionProblem();

    for (int nox = 0; nox <= 3; nox++) {
        KernelOPLSModel model = kernelopls(p.K, p.Y, 1, nox);
        KernelOPLSPrediction pred = kerneloplsPredict(model, p.K, nox);
        REQUIRE((pred.Yhat - model.fitted_values).norm() < 1e-8 * (1.0 + model.fitted_values.norm()));
        REQUIRE((pred.Tp - model.scoresP()).norm() < 1e-8 * (1.0 + model.scoresP().norm()));
        REQUIRE((pred.To - model.To).norm() < 1e-8 * (1.0 + std::sqrt(static_cast<double>(nox))));
    }
}

TEST_CASE("Prediction with fewer orthogonal components than fitted", "[kopls]") {
    RegressionProblem p = regressionProblem();
    KernelOPLSModel model = kernelopls(p.K, p.Y, 1, 2);

    Eigen::MatrixXd Xnew = normalMatrix(5, 8, 103);
    Eigen::MatrixXd KteTr = buildKernel(KernelSpec(LinearKernel{}), Xnew, p.X);
    KernelOPLSPrediction pred = kerneloplsPredict(model, KteTr, 1);
    REQUIRE(pred.Yhat.rows() == 5);
    REQUIRE(pred.To.cols() == 1);
    REQUIRE(pred.Yhat.allFinite());

    REQUIRE_THROWS_AS(kerneloplsPredict(model, KteTr, 3), InputValidationError);
    REQUIRE_THROWS_AS(kerneloplsPredict(model, KteTr.leftCols(10), 1), InputValidationError);
}

TEST_CASE("Response scaling and uncentered kernels", "[kopls]") {
    RegressionProblem p = regressionProblem();
    KernelOPLSOptions options;
    options.center_kernel = false;
    options.y_scaling = Scaling::UnitVariance;
    KernelOPLSModel model = kernelopls(p.K, p.Y, 1, 1, options);

    REQUIRE(model.y_params.scaling == Scaling::UnitVariance);
    REQUIRE(model.Y.col(0).squaredNorm() / 29.0 == Approx(1.0));
    REQUIRE(model.fitted_values.allFinite());
    REQUIRE(model.K_diag[0] == p.K);
}

TEST_CASE("Rank exhaustion", "[kopls]") {
    // A single variable gives a centered kernel of rank 1
    Eigen::MatrixXd x = normalMatrix(10, 1, 104);
    Eigen::MatrixXd K = buildKernel(KernelSpec(LinearKernel{}), x);

    REQUIRE_NOTHROW(kernelopls(K, x, 1, 0));
    REQUIRE_THROWS_AS(kernelopls(K, x, 1, 1), ConvergenceError);

    // Two identical response columns support only one predictive component
    Eigen::MatrixXd Y2(10, 2);
    Y2 << x, x;
    Eigen::MatrixXd K3 = buildKernel(KernelSpec(LinearKernel{}), normalMatrix(10, 3, 105));
    REQUIRE_THROWS_AS(kernelopls(K3, Y2, 2, 0), ConvergenceError);
}

TEST_CASE("Kernel OPLS argument checks", "[kopls]") {
    RegressionProblem p = regressionProblem();
    REQUIRE_THROWS_AS(kernelopls(p.K, p.Y, 0, 1), InputValidationError);
    REQUIRE_THROWS_AS(kernelopls(p.K, p.Y, 2, 1), InputValidationError);
    REQUIRE_THROWS_AS(kernelopls(p.K, p.Y, 1, -1), InputValidationError);
    REQUIRE_THROWS_AS(kernelopls(p.K, p.Y.topRows(20), 1, 1), InputValidationError);
}
