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

#include "ConsensusModel.h"
#include "Response.h"

namespace ConsensusOPLS {

struct ConsensusPrediction {
    Eigen::MatrixXd Yhat;                  // n_new × c, response units
    Eigen::MatrixXd Tp;                    // n_new × A, predictive scores
    Eigen::MatrixXd To;                    // n_new × nox, orthogonal scores
    // Discriminant models only
    std::vector<std::string> class_labels; // arg-max class per row
    std::vector<int> classes;              // index into the model's class names
    Eigen::VectorXd margin;                // top score minus second score
    Eigen::MatrixXd probabilities;         // n_new × c, softmax of Yhat rows
};

// Kernel between new samples and the training samples, weighted and summed
// exactly like the training kernels: sum_b rv_b * kernel(new_b, train_b) / norm_b.
// new_blocks must match the model's blocks in order, names and widths.
Eigen::MatrixXd consensusTestKernel(const ConsensusModel &model, const std::vector<DataBlock> &new_blocks);

// Predict new samples with a fitted model. Throws ConfigurationError when
// the blocks do not match the fitted ones and InputValidationError when
// they disagree on the number of rows or hold non-finite values.
ConsensusPrediction predictConsensusOPLS(const ConsensusModel &model, const std::vector<DataBlock> &new_blocks);

} // namespace ConsensusOPLS
