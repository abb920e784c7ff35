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

#include "Kernel.h"

namespace ConsensusOPLS {

struct DataBlock;

struct FusionResult {
    Eigen::VectorXd rv;                              // nblocks × 1, rescaled RV weights in [0, 1]
    Eigen::VectorXd kernel_norms;                    // nblocks × 1, Frobenius norms of the raw block kernels
    std::vector<Eigen::MatrixXd> normalized_kernels; // nblocks × (n × n)
    Eigen::MatrixXd fused;                           // n × n, sum of rv(i) * normalized_kernels[i]
};

// Modified RV coefficient (diagonals of X X' and Y Y' removed), in [-1, 1].
// Throws NumericalDegeneracyError when either cross-product has no
// off-diagonal energy.
double rvModified(const Eigen::MatrixXd &X, const Eigen::MatrixXd &Y);

// Kernel divided by its Frobenius norm; the norm is written to *norm.
// Throws NumericalDegeneracyError on a zero or non-finite norm.
Eigen::MatrixXd normalizeKernel(const Eigen::MatrixXd &K, double *norm);

// Build, normalize and RV-weight every block kernel against R (the centered
// response for regression, the indicator matrix for discriminant analysis),
// then sum the weighted kernels in ascending block order. Blocks are
// processed on up to n_workers threads.
FusionResult fuseBlocks(
    const std::vector<DataBlock> &blocks,
    const Eigen::MatrixXd &R,
    const KernelSpec &kernel,
    int n_workers
);

} // namespace ConsensusOPLS
