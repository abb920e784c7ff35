// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "ConsensusModel.h"

#include <stdexcept>
#include <utility>

namespace ConsensusOPLS {

std::vector<std::string> ConsensusModel::blockNames() const {
    std::vector<std::string> names;
    names.reserve(blocks_.size());
    for (const DataBlock &block : blocks_) names.push_back(block.name);
    return names;
}

Eigen::MatrixXd ConsensusModel::scores() const {
    const Eigen::MatrixXd &Tp = kopls_.scoresP();
    const Eigen::MatrixXd &To = kopls_.scoresO();
    Eigen::MatrixXd T(Tp.rows(), Tp.cols() + To.cols());
    T.leftCols(Tp.cols()) = Tp;
    T.rightCols(To.cols()) = To;
    return T;
}

ModelBuilder::ModelBuilder(std::vector<DataBlock> blocks, CodedResponse response, FitOptions options) {
    model_.blocks_ = std::move(blocks);
    model_.response_ = std::move(response);
    model_.options_ = std::move(options);
}

ModelBuilder &ModelBuilder::fusion(FusionResult fusion) {
    model_.fusion_ = std::move(fusion);
    has_fusion_ = true;
    return *this;
}

ModelBuilder &ModelBuilder::crossValidation(CVResult cv) {
    model_.warnings_.insert(model_.warnings_.end(), cv.warnings.begin(), cv.warnings.end());
    model_.cv_ = std::move(cv);
    has_cv_ = true;
    return *this;
}

ModelBuilder &ModelBuilder::selection(SelectionResult selection) {
    model_.selection_ = std::move(selection);
    has_selection_ = true;
    return *this;
}

ModelBuilder &ModelBuilder::finalModel(KernelOPLSModel model) {
    model_.kopls_ = std::move(model);
    has_final_ = true;
    return *this;
}

ModelBuilder &ModelBuilder::contributions(ContributionResult contributions) {
    model_.contributions_ = std::move(contributions);
    has_contributions_ = true;
    return *this;
}

ModelBuilder &ModelBuilder::permutation(PermutationStats stats) {
    model_.permutation_ = std::move(stats);
    return *this;
}

ModelBuilder &ModelBuilder::warning(std::string message) {
    model_.warnings_.push_back(std::move(message));
    return *this;
}

ConsensusModel ModelBuilder::build() {
    if (!has_fusion_ || !has_cv_ || !has_selection_ || !has_final_ || !has_contributions_) {
        throw std::logic_error("ModelBuilder::build called before every fit stage was supplied");
    }
    if (model_.selection_.n_ocomp != model_.kopls_.nox) {
        throw std::logic_error("Final model does not use the selected number of orthogonal components");
    }
    return std::move(model_);
}

} // namespace ConsensusOPLS
