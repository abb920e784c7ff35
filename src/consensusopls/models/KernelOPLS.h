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

#include "../kernels/Centering.h"

namespace ConsensusOPLS {

struct KernelOPLSOptions {
    bool center_kernel = true;          // H K H before fitting
    Scaling y_scaling = Scaling::Center; // response preprocessing
};

struct KernelOPLSModel {
    int ncomp;  // predictive components (A)
    int nox;    // orthogonal components
    Eigen::MatrixXd Cp;                   // c × A, Y-loadings
    Eigen::VectorXd Sp;                   // A × 1, singular values of Y'KY
    Eigen::MatrixXd Sps;                  // A × A, diag(Sp^-1/2)
    Eigen::MatrixXd Up;                   // n × A, Y-scores
    std::vector<Eigen::MatrixXd> Tp;      // (nox+1) × (n × A), predictive scores after i orthogonal deflations
    std::vector<Eigen::MatrixXd> Bt;      // (nox+1) × (A × A), regression of Up on Tp[i]
    std::vector<Eigen::VectorXd> co;      // nox × (A × 1)
    Eigen::VectorXd so;                   // nox × 1
    Eigen::VectorXd to_norm;              // nox × 1, norms of the orthogonal scores before normalization
    Eigen::MatrixXd To;                   // n × nox, orthogonal scores (unit norm)
    std::vector<Eigen::MatrixXd> K_first; // (nox+1) × (n × n), first-row kernels K[1,i]
    std::vector<Eigen::MatrixXd> K_diag;  // (nox+1) × (n × n), deflated kernels K[i,i]
    Eigen::MatrixXd K_train;              // n × n, uncentered training kernel
    bool center_kernel;
    ScaleParams y_params;
    Eigen::MatrixXd Y;                    // n × c, preprocessed response
    // Fit statistics indexed by the number of orthogonal components (0..nox)
    Eigen::VectorXd R2X;                  // kernel variance explained by predictive + orthogonal parts
    Eigen::VectorXd R2XO;                 // kernel variance removed by orthogonal components
    Eigen::VectorXd R2XC;                 // R2X - R2XO
    Eigen::VectorXd R2Yhat;               // response variance explained by the fitted values
    double R2Y;                           // response variance explained by Up Cp'
    Eigen::MatrixXd fitted_values;        // n × c, in response units, all nox components

    const Eigen::MatrixXd &scoresP() const { return Tp.back(); }
    const Eigen::MatrixXd &scoresO() const { return To; }
};

struct KernelOPLSPrediction {
    Eigen::MatrixXd Yhat; // n_test × c
    Eigen::MatrixXd Tp;   // n_test × A
    Eigen::MatrixXd To;   // n_test × nox
};

// Kernel OPLS (Rantalainen et al., 2007; Bylesjö et al., 2008)
//
// Parameters:
//   K       - n × n training kernel, uncentered
//   Y       - n × c response (numeric or indicator matrix)
//   ncomp   - number of predictive components, >= 1
//   nox     - number of Y-orthogonal components, >= 0
//   options - kernel centering and response scaling
//
// Throws ConvergenceError when a predictive or orthogonal component cannot
// be extracted because the kernel rank is exhausted, and
// NumericalDegeneracyError when the predictive scores are singular.
KernelOPLSModel kernelopls(
    const Eigen::MatrixXd &K,
    const Eigen::MatrixXd &Y,
    int ncomp,
    int nox,
    const KernelOPLSOptions &options = KernelOPLSOptions()
);

// Project test samples. KteTr is the n_test × n_train kernel between test
// and training samples (uncentered). nox may be any count up to model.nox.
// With rescale_y the predictions are returned in response units.
KernelOPLSPrediction kerneloplsPredict(
    const KernelOPLSModel &model,
    const Eigen::MatrixXd &KteTr,
    int nox,
    bool rescale_y = true
);

} // namespace ConsensusOPLS
