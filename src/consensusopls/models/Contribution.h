// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <string>
#include <vector>

#include <Eigen/Core>

#include "KernelOPLS.h"
#include "Response.h"

namespace ConsensusOPLS {

struct ContributionResult {
    std::vector<std::string> component_names; // "p_1".."p_A", "o_1".."o_nox"
    Eigen::MatrixXd lambda;                   // nblocks × (A + nox), t' K_b t per block and component
    Eigen::MatrixXd contribution;             // nblocks × (A + nox), lambda normalized per column
    std::vector<Eigen::MatrixXd> loadings;    // per block, p_b × (A + nox)
    std::vector<Eigen::MatrixXd> vip;         // per block, p_b × 3: predictive, orthogonal, total
};

std::vector<std::string> componentNames(int ncomp, int nox);

// Block contributions, loadings and VIP of a fitted model. scores are the
// model's predictive scores followed by its orthogonal scores; blocks and
// normalized_kernels are in the same order. Blocks are processed on up to
// n_workers threads. Throws NumericalDegeneracyError if some component has
// no positive lambda in any block.
ContributionResult decomposeContributions(
    const std::vector<DataBlock> &blocks,
    const std::vector<Eigen::MatrixXd> &normalized_kernels,
    const KernelOPLSModel &model,
    int n_workers
);

} // namespace ConsensusOPLS
