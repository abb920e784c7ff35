// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "KernelOPLS.h"

#include <cmath>
#include <limits>
#include <utility>

#include <Eigen/QR>
#include <Eigen/SVD>
#include <fmt/core.h>

#include "../utils/Errors.h"

namespace ConsensusOPLS {

namespace {

// Relative size below which a singular value counts as rank exhaustion.
constexpr double kRankTol = 1e-10;

// Bt = (Tp'Tp)^-1 Tp' Up via a rank-revealing QR of Tp.
Eigen::MatrixXd regressScores(const Eigen::MatrixXd &Tp, const Eigen::MatrixXd &Up) {
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(Tp);
    if (qr.rank() < Tp.cols()) {
        throw NumericalDegeneracyError(fmt::format(
            "Predictive scores are rank deficient ({} of {} columns)", qr.rank(), Tp.cols()
        ));
    }
    return qr.solve(Up);
}

} // namespace

KernelOPLSModel kernelopls(
    const Eigen::MatrixXd &K,
    const Eigen::MatrixXd &Y,
    int ncomp,
    int nox,
    const KernelOPLSOptions &options
) {
    const int n = K.rows();
    const int nresp = Y.cols();
    if (K.cols() != n || Y.rows() != n) {
        throw InputValidationError(fmt::format(
            "Kernel is {}x{} but the response has {} rows", K.rows(), K.cols(), Y.rows()
        ));
    }
    if (ncomp < 1 || ncomp > nresp) {
        throw InputValidationError(fmt::format(
            "Number of predictive components must be in [1, {}], got {}", nresp, ncomp
        ));
    }
    if (nox < 0) {
        throw InputValidationError(fmt::format("Number of orthogonal components must be >= 0, got {}", nox));
    }

    KernelOPLSModel model;
    model.ncomp = ncomp;
    model.nox = nox;
    model.center_kernel = options.center_kernel;
    model.K_train = K;

    // 1. Preprocess kernel and response
    Eigen::MatrixXd Kc = options.center_kernel ? centerTrainKernel(K) : K;
    ScaledMatrix scaled = scaleColumns(Y, options.y_scaling);
    model.Y = std::move(scaled.X);
    model.y_params = std::move(scaled.params);
    const Eigen::MatrixXd &Ys = model.Y;

    const double sstot_K = Kc.trace();
    const double sstot_Y = Ys.squaredNorm();
    if (!(sstot_K > 0) || !std::isfinite(sstot_K)) {
        throw NumericalDegeneracyError("Kernel has no variance after centering");
    }
    if (!(sstot_Y > 0) || !std::isfinite(sstot_Y)) {
        throw NumericalDegeneracyError("Response has no variance after preprocessing");
    }

    // 2. Predictive response components from Y'KY
    Eigen::MatrixXd YtKY = Ys.transpose() * Kc * Ys;
    Eigen::BDCSVD<Eigen::MatrixXd> svd(YtKY, Eigen::ComputeThinU);
    const Eigen::VectorXd &sv = svd.singularValues();
    for (int a = 0; a < ncomp; a++) {
        if (!(sv(0) > 0) || !(sv(a) > kRankTol * sv(0))) {
            throw ConvergenceError(fmt::format(
                "Predictive component {} cannot be extracted: Y'KY has rank below {}", a + 1, ncomp
            ));
        }
    }
    model.Cp = svd.matrixU().leftCols(ncomp);
    model.Sp = sv.head(ncomp);
    model.Sps = model.Sp.array().sqrt().inverse().matrix().asDiagonal();
    model.Up = Ys * model.Cp;

    // 3. Orthogonal components by kernel deflation
    model.K_first.reserve(nox + 1);
    model.K_diag.reserve(nox + 1);
    model.Tp.reserve(nox + 1);
    model.Bt.reserve(nox + 1);
    model.co.reserve(nox);
    model.so.resize(nox);
    model.to_norm.resize(nox);
    model.To.resize(n, nox);
    model.K_first.push_back(Kc);
    model.K_diag.push_back(std::move(Kc));

    const double so_tol = kRankTol * sstot_K * sstot_K;
    const double norm_tol = std::numeric_limits<double>::epsilon() * std::sqrt(sstot_K);

    for (int i = 0; i < nox; i++) {
        const Eigen::MatrixXd &K1i = model.K_first[i];
        const Eigen::MatrixXd &Kii = model.K_diag[i];

        // 3.1 Predictive scores and their regression onto Up
        Eigen::MatrixXd Tp_i = K1i.transpose() * model.Up * model.Sps;
        model.Bt.push_back(regressScores(Tp_i, model.Up));

        // 3.2 Leading direction of (K_ii - Tp Tp') seen through Tp
        Eigen::MatrixXd E_Tp = Kii * Tp_i - Tp_i * (Tp_i.transpose() * Tp_i);
        Eigen::MatrixXd M = Tp_i.transpose() * E_Tp;
        Eigen::BDCSVD<Eigen::MatrixXd> svd_o(M, Eigen::ComputeThinU);
        const double so = svd_o.singularValues()(0);
        if (!(so > so_tol) || !std::isfinite(so)) {
            throw ConvergenceError(fmt::format(
                "Orthogonal component {} cannot be extracted: kernel rank exhausted", i + 1
            ));
        }
        Eigen::VectorXd co = svd_o.matrixU().col(0);

        // 3.3 Orthogonal score, unit norm
        Eigen::VectorXd to = E_Tp * co / std::sqrt(so);
        const double to_norm = to.norm();
        if (!(to_norm > norm_tol) || !std::isfinite(to_norm)) {
            throw ConvergenceError(fmt::format(
                "Orthogonal component {} cannot be extracted: near-zero score norm", i + 1
            ));
        }
        to /= to_norm;

        // 3.4 Deflate: K[1,i+1] = K[1,i] (I - tt'), K[i+1,i+1] = (I - tt') K[i,i] (I - tt')
        Eigen::VectorXd K1t = K1i * to;
        Eigen::MatrixXd K1_next = K1i - K1t * to.transpose();
        Eigen::VectorXd Kt = Kii * to;
        Eigen::VectorXd tK = Kii.transpose() * to;
        const double tKt = to.dot(Kt);
        Eigen::MatrixXd Kii_next = Kii - Kt * to.transpose() - to * tK.transpose()
            + tKt * (to * to.transpose());

        model.Tp.push_back(std::move(Tp_i));
        model.co.push_back(std::move(co));
        model.so(i) = so;
        model.to_norm(i) = to_norm;
        model.To.col(i) = to;
        model.K_first.push_back(std::move(K1_next));
        model.K_diag.push_back(std::move(Kii_next));
    }

    // 4. Final predictive scores after all orthogonal deflations
    Eigen::MatrixXd Tp_last = model.K_first[nox].transpose() * model.Up * model.Sps;
    model.Bt.push_back(regressScores(Tp_last, model.Up));
    model.Tp.push_back(std::move(Tp_last));

    // 5. Fit statistics per number of orthogonal components
    model.R2X.resize(nox + 1);
    model.R2XO.resize(nox + 1);
    model.R2XC.resize(nox + 1);
    model.R2Yhat.resize(nox + 1);
    for (int i = 0; i <= nox; i++) {
        const double trace_i = model.K_diag[i].trace();
        model.R2X(i) = 1.0 - (trace_i - model.Tp[i].squaredNorm()) / sstot_K;
        model.R2XO(i) = 1.0 - trace_i / sstot_K;
        model.R2XC(i) = model.R2X(i) - model.R2XO(i);
        Eigen::MatrixXd Yhat_i = model.Tp[i] * model.Bt[i] * model.Cp.transpose();
        model.R2Yhat(i) = 1.0 - (Yhat_i - Ys).squaredNorm() / sstot_Y;
    }
    model.R2Y = 1.0 - (Ys - model.Up * model.Cp.transpose()).squaredNorm() / sstot_Y;
    model.fitted_values = rescaleColumns(
        model.Tp[nox] * model.Bt[nox] * model.Cp.transpose(), model.y_params
    );

    return model;
}

KernelOPLSPrediction kerneloplsPredict(
    const KernelOPLSModel &model,
    const Eigen::MatrixXd &KteTr,
    int nox,
    bool rescale_y
) {
    const int n_train = model.K_train.rows();
    if (KteTr.cols() != n_train) {
        throw InputValidationError(fmt::format(
            "Test kernel has {} columns, the model was fitted on {} samples", KteTr.cols(), n_train
        ));
    }
    if (nox < 0 || nox > model.nox) {
        throw InputValidationError(fmt::format(
            "Cannot predict with {} orthogonal components from a model with {}", nox, model.nox
        ));
    }

    KernelOPLSPrediction result;
    const int n_test = KteTr.rows();

    // KteTr[i,1] and KteTr[i,i] of the test/train deflation
    Eigen::MatrixXd Kte1 = model.center_kernel ? centerTestKernel(KteTr, model.K_train) : KteTr;
    Eigen::MatrixXd Ktei = Kte1;
    result.To.resize(n_test, nox);

    for (int i = 0; i < nox; i++) {
        const Eigen::VectorXd to = model.To.col(i);
        const Eigen::MatrixXd &Tp_train = model.Tp[i];

        Eigen::MatrixXd Tp_te = Kte1 * model.Up * model.Sps;
        Eigen::VectorXd To_te = (Ktei * Tp_train - Tp_te * (Tp_train.transpose() * Tp_train))
            * model.co[i] / (std::sqrt(model.so(i)) * model.to_norm(i));

        // KteTr[i+1,1] = KteTr[i,1] - to_te to' K[1,i]'
        Eigen::VectorXd K1t = model.K_first[i] * to;
        Kte1 -= To_te * K1t.transpose();

        // KteTr[i+1,i+1] = KteTr[i,i] (I - tt') - to_te t' K[i,i] (I - tt')
        const Eigen::MatrixXd &Kii = model.K_diag[i];
        Eigen::VectorXd Ktet = Ktei * to;
        Eigen::VectorXd tK = Kii.transpose() * to;
        const double tKt = to.dot(Kii * to);
        Ktei = Ktei - Ktet * to.transpose() - To_te * tK.transpose() + tKt * (To_te * to.transpose());

        result.To.col(i) = To_te;
    }

    result.Tp = Kte1 * model.Up * model.Sps;
    result.Yhat = result.Tp * model.Bt[nox] * model.Cp.transpose();
    if (rescale_y) {
        result.Yhat = rescaleColumns(result.Yhat, model.y_params);
    }
    return result;
}

} // namespace ConsensusOPLS
