// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Predict.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <fmt/core.h>

#include "../kernels/Kernel.h"
#include "../utils/Errors.h"
#include "KernelOPLS.h"

namespace ConsensusOPLS {

namespace {

void checkBlocks(const ConsensusModel &model, const std::vector<DataBlock> &new_blocks) {
    const std::vector<DataBlock> &train = model.blocks();
    if (new_blocks.size() != train.size()) {
        throw ConfigurationError(fmt::format(
            "Model was fitted on {} blocks, got {}", train.size(), new_blocks.size()
        ));
    }
    for (std::size_t i = 0; i < train.size(); i++) {
        const DataBlock &ref = train[i];
        const DataBlock &block = new_blocks[i];
        if (!block.name.empty() && block.name != ref.name) {
            throw ConfigurationError(fmt::format(
                "Block {} is named '{}' but the model expects '{}'", i + 1, block.name, ref.name
            ));
        }
        if (block.X.cols() != ref.X.cols()) {
            throw ConfigurationError(fmt::format(
                "Block '{}' has {} variables, the model was fitted with {}", ref.name, block.X.cols(), ref.X.cols()
            ));
        }
        if (!block.variable_names.empty() && !ref.variable_names.empty()
            && block.variable_names != ref.variable_names) {
            throw ConfigurationError(fmt::format("Variable names of block '{}' differ from the fitted ones", ref.name));
        }
        if (block.X.rows() != new_blocks[0].X.rows()) {
            throw InputValidationError(fmt::format(
                "Block '{}' has {} rows but the first block has {}", ref.name, block.X.rows(), new_blocks[0].X.rows()
            ));
        }
        if (!block.X.allFinite()) {
            throw InputValidationError(fmt::format("Block '{}' contains non-finite values", ref.name));
        }
    }
}

} // namespace

Eigen::MatrixXd consensusTestKernel(const ConsensusModel &model, const std::vector<DataBlock> &new_blocks) {
    checkBlocks(model, new_blocks);
    const std::vector<DataBlock> &train = model.blocks();
    const Eigen::VectorXd &rv = model.rvWeights();
    const Eigen::VectorXd &norms = model.kernelNorms();

    Eigen::MatrixXd KteTr = Eigen::MatrixXd::Zero(new_blocks[0].X.rows(), model.nSamples());
    for (std::size_t i = 0; i < train.size(); i++) {
        KteTr += (rv(i) / norms(i)) * buildKernel(model.kernel(), new_blocks[i].X, train[i].X);
    }
    return KteTr;
}

ConsensusPrediction predictConsensusOPLS(const ConsensusModel &model, const std::vector<DataBlock> &new_blocks) {
    Eigen::MatrixXd KteTr = consensusTestKernel(model, new_blocks);
    KernelOPLSPrediction pred = kerneloplsPredict(model.koplsModel(), KteTr, model.nOcomp(), true);

    ConsensusPrediction result;
    result.Yhat = std::move(pred.Yhat);
    result.Tp = std::move(pred.Tp);
    result.To = std::move(pred.To);
    if (model.modelType() != ModelType::Discriminant) return result;

    // Class assignment from the indicator predictions
    const int n = result.Yhat.rows();
    const int nclass = result.Yhat.cols();
    result.classes = argMaxClasses(result.Yhat);
    result.class_labels.reserve(n);
    result.margin.resize(n);
    result.probabilities.resize(n, nclass);
    for (int i = 0; i < n; i++) {
        const int top = result.classes[i];
        result.class_labels.push_back(model.classNames()[top]);

        double second = -std::numeric_limits<double>::infinity();
        for (int j = 0; j < nclass; j++) {
            if (j != top) second = std::max(second, result.Yhat(i, j));
        }
        result.margin(i) = result.Yhat(i, top) - second;

        // Softmax, shifted by the row maximum
        Eigen::RowVectorXd e = (result.Yhat.row(i).array() - result.Yhat(i, top)).exp();
        result.probabilities.row(i) = e / e.sum();
    }
    return result;
}

} // namespace ConsensusOPLS
