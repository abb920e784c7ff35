// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <vector>

#include "ConsensusModel.h"
#include "Response.h"

namespace ConsensusOPLS {

// Check the data-independent options; throws InputValidationError.
void validateFitOptions(const FitOptions &options);

// Check that blocks share a row count and hold finite data with matching
// variable names; unnamed blocks are named "block_<i>". Throws
// InputValidationError.
std::vector<DataBlock> prepareBlocks(std::vector<DataBlock> blocks);

// Largest usable number of orthogonal components:
// min(max_ocomp, nsample - max_pcomp, smallest block width), at least 0.
int clampOrthogonalCount(int max_ocomp, int max_pcomp, int nsample, const std::vector<DataBlock> &blocks);

// Consensus OPLS over several data blocks
//
// Every block kernel is normalized and weighted by its modified RV
// coefficient with the response, the weighted kernels are summed, and a
// kernel OPLS model is cross-validated on the fused kernel to choose the
// number of orthogonal components. The final model is refitted on all
// samples and decomposed into block contributions, loadings and VIP.
//
// Parameters:
//   blocks   - data blocks with the same samples in the same row order
//   response - numeric response, or class labels for discriminant models
//   options  - see FitOptions
//
// Throws InputValidationError and ConfigurationError for bad input (before
// any kernel is computed), NumericalDegeneracyError and ConvergenceError
// when the full-data model cannot be computed.
ConsensusModel fitConsensusOPLS(
    const std::vector<DataBlock> &blocks,
    const Response &response,
    const FitOptions &options
);

} // namespace ConsensusOPLS
