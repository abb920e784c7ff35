// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Permutation.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "../utils/Errors.h"
#include "../utils/Parallel.h"
#include "../utils/Random.h"

namespace ConsensusOPLS {

double pearsonCorrelation(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
    Eigen::VectorXd xc = x.array() - x.mean();
    Eigen::VectorXd yc = y.array() - y.mean();
    const double denom = xc.norm() * yc.norm();
    if (!(denom > 0)) return std::numeric_limits<double>::quiet_NaN();
    return xc.dot(yc) / denom;
}

double permutationPValue(const Eigen::VectorXd &values) {
    const double observed = values(0);
    if (!std::isfinite(observed)) return std::numeric_limits<double>::quiet_NaN();
    int exceed = 0;
    for (int i = 1; i < values.size(); i++) {
        if (values(i) >= observed) exceed++;
    }
    return (1.0 + exceed) / static_cast<double>(values.size());
}

PermutationStats permutationTest(
    const CodedResponse &response,
    const PermutationSample &observed,
    int n_perm,
    std::uint64_t seed,
    int n_workers,
    const PipelineRunner &run
) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const int n = response.Y.rows();

    PermutationStats stats;
    stats.n_perm = n_perm;
    stats.r2_yhat.resize(n_perm + 1);
    stats.q2_yhat.resize(n_perm + 1);
    stats.dq2.resize(n_perm + 1);
    stats.y_correlation.resize(n_perm + 1);
    stats.r2_yhat(0) = observed.r2_yhat;
    stats.q2_yhat(0) = observed.q2_yhat;
    stats.dq2(0) = observed.dq2;
    stats.y_correlation(0) = 1.0;

    std::vector<std::string> failures(n_perm);
    parallelFor(n_perm, n_workers, [&](int r) {
        std::mt19937_64 rng = makeGenerator(seed, RandomStream::Permutation, r);
        std::vector<int> order = randomPermutation(n, rng);
        CodedResponse permuted = permuteRows(response, order);
        stats.y_correlation(r + 1) = pearsonCorrelation(permuted.Y.col(0), response.Y.col(0));

        PermutationSample sample{nan, nan, nan};
        try {
            sample = run(permuted);
        } catch (const ConvergenceError &e) {
            failures[r] = e.what();
        } catch (const NumericalDegeneracyError &e) {
            failures[r] = e.what();
        }
        stats.r2_yhat(r + 1) = sample.r2_yhat;
        stats.q2_yhat(r + 1) = sample.q2_yhat;
        stats.dq2(r + 1) = sample.dq2;
    });

    for (int r = 0; r < n_perm; r++) {
        if (!failures[r].empty()) stats.failures.push_back({r, failures[r]});
    }
    stats.p_r2_yhat = permutationPValue(stats.r2_yhat);
    stats.p_q2_yhat = permutationPValue(stats.q2_yhat);
    stats.p_dq2 = permutationPValue(stats.dq2);
    return stats;
}

} // namespace ConsensusOPLS
