// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "../models/Response.h"

namespace ConsensusOPLS {

// Statistics of one complete fit, at the orthogonal count that fit selected.
struct PermutationSample {
    double r2_yhat;
    double q2_yhat;
    double dq2; // NaN for regression
};

// A permutation whose pipeline failed; its statistics are NaN.
struct PermutationFailure {
    int permutation;
    std::string message;
};

struct PermutationStats {
    int n_perm;
    // (n_perm+1) × 1 each; element 0 is the unpermuted model
    Eigen::VectorXd r2_yhat;
    Eigen::VectorXd q2_yhat;
    Eigen::VectorXd dq2;
    Eigen::VectorXd y_correlation; // corr(permuted, original) of the first response column
    // (1 + #{permuted >= observed}) / (1 + n_perm); NaN when the observed value is NaN
    double p_r2_yhat;
    double p_q2_yhat;
    double p_dq2;
    std::vector<PermutationFailure> failures;
};

// Runs the whole modeling pipeline on a (permuted) response.
using PipelineRunner = std::function<PermutationSample(const CodedResponse &)>;

// Pearson correlation of two vectors; NaN if either is constant.
double pearsonCorrelation(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

// Empirical p-value of observed against values(1..n); non-finite permuted
// values never count as exceeding.
double permutationPValue(const Eigen::VectorXd &values);

// Permutation test. Permutation r draws its row order from a generator
// seeded with (seed, r), so results do not depend on n_workers. A run that
// fails with ConvergenceError or NumericalDegeneracyError records NaN.
PermutationStats permutationTest(
    const CodedResponse &response,
    const PermutationSample &observed,
    int n_perm,
    std::uint64_t seed,
    int n_workers,
    const PipelineRunner &run
);

} // namespace ConsensusOPLS
