// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "RVFusion.h"

#include <algorithm>
#include <cmath>
#include <string>

#include <fmt/core.h>

#include "../models/Response.h"
#include "../utils/Errors.h"
#include "../utils/Parallel.h"

namespace ConsensusOPLS {

double rvModified(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y) {
    Eigen::MatrixXd AA = X * X.transpose();
    Eigen::MatrixXd BB = Y * Y.transpose();
    AA.diagonal().setZero();
    BB.diagonal().setZero();

    const double denom = std::sqrt(AA.squaredNorm() * BB.squaredNorm());
    if (!(denom > 0) || !std::isfinite(denom)) {
        throw NumericalDegeneracyError("RV coefficient is undefined: a cross-product matrix has no off-diagonal energy");
    }
    return (AA.array() * BB.array()).sum() / denom;
}

Eigen::MatrixXd normalizeKernel(const Eigen::MatrixXd &K, double *norm) {
    const double frob = K.norm();
    if (!(frob > 0) || !std::isfinite(frob)) {
        throw NumericalDegeneracyError(fmt::format("Kernel has a Frobenius norm of {}", frob));
    }
    *norm = frob;
    return K / frob;
}

FusionResult fuseBlocks(
    const std::vector<DataBlock> &blocks,
    const Eigen::MatrixXd &R,
    const KernelSpec &kernel,
    int n_workers
) {
    const int nblocks = blocks.size();
    FusionResult result;
    result.rv.resize(nblocks);
    result.kernel_norms.resize(nblocks);
    result.normalized_kernels.resize(nblocks);

    // 1. Per-block kernels, independent of each other
    std::vector<std::string> errors(nblocks);
    parallelFor(nblocks, n_workers, [&](int i) {
        try {
            double norm = 0;
            result.normalized_kernels[i] = normalizeKernel(buildKernel(kernel, blocks[i].X), &norm);
            result.kernel_norms(i) = norm;
            double rv = (rvModified(result.normalized_kernels[i], R) + 1.0) / 2.0;
            result.rv(i) = std::min(std::max(rv, 0.0), 1.0);
        } catch (const NumericalDegeneracyError &e) {
            errors[i] = e.what();
        }
    });
    for (int i = 0; i < nblocks; i++) {
        if (!errors[i].empty()) {
            throw NumericalDegeneracyError(fmt::format("Block '{}': {}", blocks[i].name, errors[i]));
        }
    }

    // 2. Weighted sum, ascending block order
    const int n = blocks.empty() ? 0 : blocks[0].X.rows();
    result.fused = Eigen::MatrixXd::Zero(n, n);
    for (int i = 0; i < nblocks; i++) {
        result.fused += result.rv(i) * result.normalized_kernels[i];
    }
    return result;
}

} // namespace ConsensusOPLS
