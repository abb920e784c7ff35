// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Contribution.h"

#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "../utils/Errors.h"
#include "../utils/Parallel.h"

namespace ConsensusOPLS {

namespace {

// sqrt(p * sum_a weight_a * w_ja^2 / sum_a weight_a) with w normalized per
// column; NaN when the weights sum to zero or no column is given.
Eigen::VectorXd vipColumn(const Eigen::MatrixXd &L, const Eigen::VectorXd &weights) {
    const int p = L.rows();
    const double total = weights.sum();
    if (L.cols() == 0 || !(total > 0)) {
        return Eigen::VectorXd::Constant(p, std::numeric_limits<double>::quiet_NaN());
    }
    Eigen::VectorXd acc = Eigen::VectorXd::Zero(p);
    for (int a = 0; a < L.cols(); a++) {
        const double norm2 = L.col(a).squaredNorm();
        if (!(norm2 > 0)) continue;
        acc += weights(a) * L.col(a).array().square().matrix() / norm2;
    }
    return (static_cast<double>(p) * acc / total).array().sqrt().matrix();
}

} // namespace

std::vector<std::string> componentNames(int ncomp, int nox) {
    std::vector<std::string> names;
    for (int a = 0; a < ncomp; a++) names.push_back(fmt::format("p_{}", a + 1));
    for (int a = 0; a < nox; a++) names.push_back(fmt::format("o_{}", a + 1));
    return names;
}

ContributionResult decomposeContributions(
    const std::vector<DataBlock> &blocks,
    const std::vector<Eigen::MatrixXd> &normalized_kernels,
    const KernelOPLSModel &model,
    int n_workers
) {
    const int nblocks = blocks.size();
    const int ncomp = model.ncomp;
    const int nox = model.nox;
    const int ntot = ncomp + nox;
    const int n = model.To.rows();

    ContributionResult result;
    result.component_names = componentNames(ncomp, nox);

    Eigen::MatrixXd T(n, ntot);
    T.leftCols(ncomp) = model.scoresP();
    T.rightCols(nox) = model.scoresO();
    Eigen::VectorXd t_norm2 = T.colwise().squaredNorm().transpose();
    for (int a = 0; a < ntot; a++) {
        if (!(t_norm2(a) > 0)) {
            throw NumericalDegeneracyError(fmt::format("Score {} has zero norm", result.component_names[a]));
        }
    }

    // Response variance explained by each predictive score
    Eigen::VectorXd ssy(ncomp);
    for (int a = 0; a < ncomp; a++) {
        ssy(a) = (T.col(a).transpose() * model.Y).squaredNorm() / t_norm2(a);
    }

    // 1. Per-block lambda, loadings and VIP
    result.lambda.resize(nblocks, ntot);
    result.loadings.resize(nblocks);
    result.vip.resize(nblocks);
    parallelFor(nblocks, n_workers, [&](int b) {
        const Eigen::MatrixXd &Kb = normalized_kernels[b];
        result.lambda.row(b) = (T.transpose() * Kb * T).diagonal().transpose();

        Eigen::MatrixXd L = blocks[b].X.transpose() * T;
        L.array().rowwise() /= t_norm2.transpose().array();
        result.loadings[b] = L;

        Eigen::VectorXd lambda_b = result.lambda.row(b).transpose();
        Eigen::MatrixXd vip(L.rows(), 3);
        vip.col(0) = vipColumn(L.leftCols(ncomp), ssy);
        vip.col(1) = vipColumn(L.rightCols(nox), lambda_b.tail(nox));
        vip.col(2) = vipColumn(L, lambda_b);
        result.vip[b] = vip;
    });

    // 2. Contributions, normalized per component column
    result.contribution.resize(nblocks, ntot);
    for (int a = 0; a < ntot; a++) {
        const double total = result.lambda.col(a).sum();
        if (!(total > 0) || !std::isfinite(total)) {
            throw NumericalDegeneracyError(fmt::format(
                "Block contributions of component {} are undefined (lambda sum {})",
                result.component_names[a], total
            ));
        }
        result.contribution.col(a) = result.lambda.col(a) / total;
    }
    return result;
}

} // namespace ConsensusOPLS
