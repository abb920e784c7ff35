// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "../models/KernelOPLS.h"

namespace ConsensusOPLS {

enum class CVType {
    NFold, // interleaved n-fold
    MCCV,  // Monte Carlo
    MCCVB  // class-balanced Monte Carlo (discriminant only)
};

// Accepts "nfold", "mccv", "mccvb". Throws InputValidationError otherwise.
CVType parseCVType(const std::string &tag);
std::string cvTypeName(CVType type);

struct CVFold {
    std::vector<int> train; // ascending
    std::vector<int> test;  // ascending
};

struct CVSettings {
    CVType type = CVType::NFold;
    int nfold = 5;           // rounds for nfold
    int n_mc = 100;          // rounds for mccv / mccvb
    double cv_frac = 4.0 / 5.0; // training fraction for mccv / mccvb
    std::uint64_t seed = 0;
};

// Number of rounds the settings produce.
int cvRounds(const CVSettings &settings);

// Check settings against the sample count; throws InputValidationError.
// classes is required (non-empty) for MCCVB.
void validateCVSettings(const CVSettings &settings, int nsample, const std::vector<int> &classes);

// Train/test split for one round. Random rounds draw from a generator seeded
// by (settings.seed, round) so every round can be generated independently.
CVFold makeFold(const CVSettings &settings, int nsample, const std::vector<int> &classes, int round);

// All rounds in order.
std::vector<CVFold> makePartition(const CVSettings &settings, int nsample, const std::vector<int> &classes);

// A (round, orthogonal count) cell whose fit or prediction failed.
struct CellFailure {
    int round;
    int nox;
    std::string message;
};

struct CVResult {
    int max_pcomp;
    int max_ocomp;
    std::vector<CVFold> folds;
    Eigen::MatrixXd all_yhat;       // sum(test sizes) × ((max_ocomp+1) * c), column block k = k orthogonal components
    std::vector<int> test_index;    // concatenated test indices, aligned with all_yhat rows
    Eigen::MatrixXd y_test;         // observed response rows aligned with all_yhat
    Eigen::VectorXd q2_yhat;        // (max_ocomp+1) × 1
    Eigen::MatrixXd q2_yhat_vars;   // (max_ocomp+1) × c, per response column
    Eigen::VectorXd press;          // (max_ocomp+1) × 1
    std::vector<CellFailure> failures;
    std::vector<std::string> warnings;

    // Held-out predictions for k orthogonal components (rows × c).
    Eigen::MatrixXd yhat(int k) const;
};

// Cross-validate kernel OPLS on the fused kernel K: every cell (round, k),
// k = 0..max_ocomp, fits on the training rows/columns and predicts the test
// rows. Cells run on up to n_workers threads; ConvergenceError and
// NumericalDegeneracyError inside a cell are recorded in failures and turn
// that cell's predictions into NaN.
CVResult crossValidate(
    const Eigen::MatrixXd &K,
    const Eigen::MatrixXd &Y,
    const std::vector<int> &classes,
    int max_pcomp,
    int max_ocomp,
    const CVSettings &settings,
    const KernelOPLSOptions &options,
    int n_workers
);

// 1 - PRESS / TSS over the finite rows of yhat, with TSS around y_means.
// NaN when no row is finite.
double q2Statistic(const Eigen::MatrixXd &y, const Eigen::MatrixXd &yhat, const Eigen::VectorXd &y_means);

} // namespace ConsensusOPLS
