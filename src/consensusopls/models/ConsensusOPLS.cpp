// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "ConsensusOPLS.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include <fmt/core.h>

#include "../kernels/Centering.h"
#include "../kernels/RVFusion.h"
#include "../utils/Errors.h"
#include "../utils/ProgressLog.h"
#include "../validation/ComponentSelection.h"
#include "../validation/CrossValidation.h"
#include "../validation/Permutation.h"
#include "Contribution.h"
#include "KernelOPLS.h"

namespace ConsensusOPLS {

namespace {

struct PipelineStages {
    FusionResult fusion;
    CVResult cv;
    SelectionResult selection;
    KernelOPLSModel model;
};

CVSettings cvSettings(const FitOptions &options) {
    CVSettings settings;
    settings.type = options.cv_type;
    settings.nfold = options.nfold;
    settings.n_mc = options.n_mc;
    settings.cv_frac = options.cv_frac;
    settings.seed = options.seed;
    return settings;
}

KernelOPLSOptions koplsOptions(const FitOptions &options) {
    KernelOPLSOptions kopts;
    kopts.center_kernel = options.kernel_centering;
    kopts.y_scaling = options.y_scaling;
    return kopts;
}

// Response the block kernels are compared with: the indicator matrix for
// discriminant models, the mean-centered response otherwise.
Eigen::MatrixXd rvReference(const CodedResponse &response) {
    if (response.type == ModelType::Discriminant) return response.Y;
    return response.Y.rowwise() - response.Y.colwise().mean();
}

// Fusion, cross-validation, selection and the final fit. Shared by the
// main fit and every permutation run.
PipelineStages runPipeline(
    const std::vector<DataBlock> &blocks,
    const CodedResponse &response,
    const FitOptions &options,
    int max_ocomp,
    int n_workers,
    ProgressTracker &progress
) {
    PipelineStages stages;
    const KernelOPLSOptions kopts = koplsOptions(options);

    // 1. RV-weighted kernel fusion
    stages.fusion = fuseBlocks(blocks, rvReference(response), options.kernel, n_workers);
    progress.stageDone("Kernel fusion");

    // 2. Cross-validation over 0..max_ocomp orthogonal components
    stages.cv = crossValidate(
        stages.fusion.fused, response.Y, response.classes,
        options.max_pcomp, max_ocomp, cvSettings(options), kopts, n_workers
    );
    progress.stageDone("Cross-validation");

    // 3. Number of orthogonal components
    stages.selection = selectComponents(stages.cv, response.type, n_workers);
    progress.log("Selected {} orthogonal component(s)", stages.selection.n_ocomp);

    // 4. Final model on all samples
    stages.model = kernelopls(
        stages.fusion.fused, response.Y, options.max_pcomp, stages.selection.n_ocomp, kopts
    );
    progress.stageDone("Final model");
    return stages;
}

PermutationSample summarize(const PipelineStages &stages, ModelType type) {
    const int k = stages.selection.n_ocomp;
    PermutationSample sample;
    sample.r2_yhat = stages.model.R2Yhat(k);
    sample.q2_yhat = stages.cv.q2_yhat(k);
    sample.dq2 = type == ModelType::Discriminant ? stages.selection.curve(k)
                                                 : std::numeric_limits<double>::quiet_NaN();
    return sample;
}

} // namespace

void validateFitOptions(const FitOptions &options) {
    if (options.max_pcomp < 1) {
        throw InputValidationError(fmt::format("maxPcomp must be >= 1, got {}", options.max_pcomp));
    }
    if (options.max_ocomp < 0) {
        throw InputValidationError(fmt::format("maxOcomp must be >= 0, got {}", options.max_ocomp));
    }
    if (options.n_workers < 1) {
        throw InputValidationError(fmt::format("Number of workers must be >= 1, got {}", options.n_workers));
    }
    if (options.n_perm < 0) {
        throw InputValidationError(fmt::format("Number of permutations must be >= 0, got {}", options.n_perm));
    }
    if (options.cv_type == CVType::MCCVB && options.model_type != ModelType::Discriminant) {
        throw InputValidationError("cvType 'mccvb' requires modelType 'da'");
    }
}

std::vector<DataBlock> prepareBlocks(std::vector<DataBlock> blocks) {
    if (blocks.empty()) {
        throw InputValidationError("At least one data block is required");
    }
    const int nsample = blocks[0].X.rows();
    std::set<std::string> names;
    for (std::size_t i = 0; i < blocks.size(); i++) {
        DataBlock &block = blocks[i];
        if (block.name.empty()) block.name = fmt::format("block_{}", i + 1);
        if (!names.insert(block.name).second) {
            throw InputValidationError(fmt::format("Duplicate block name '{}'", block.name));
        }
        if (block.X.rows() != nsample) {
            throw InputValidationError(fmt::format(
                "Block '{}' has {} rows but block '{}' has {}; all blocks must share the same samples",
                block.name, block.X.rows(), blocks[0].name, nsample
            ));
        }
        if (block.X.cols() == 0) {
            throw InputValidationError(fmt::format("Block '{}' has no variables", block.name));
        }
        if (!block.X.allFinite()) {
            throw InputValidationError(fmt::format("Block '{}' contains non-finite values", block.name));
        }
        if (!block.variable_names.empty() && static_cast<int>(block.variable_names.size()) != block.X.cols()) {
            throw InputValidationError(fmt::format(
                "Block '{}' has {} variables but {} variable names",
                block.name, block.X.cols(), block.variable_names.size()
            ));
        }
    }
    if (nsample < 2) {
        throw InputValidationError(fmt::format("At least two samples are required, got {}", nsample));
    }
    return blocks;
}

int clampOrthogonalCount(int max_ocomp, int max_pcomp, int nsample, const std::vector<DataBlock> &blocks) {
    int clamped = std::min(max_ocomp, nsample - max_pcomp);
    for (const DataBlock &block : blocks) {
        clamped = std::min(clamped, static_cast<int>(block.X.cols()));
    }
    return std::max(clamped, 0);
}

ConsensusModel fitConsensusOPLS(
    const std::vector<DataBlock> &blocks_in,
    const Response &response,
    const FitOptions &options_in
) {
    ProgressTracker progress(options_in.verbose);

    // 1. Validate everything before any kernel is computed
    validateFitOptions(options_in);
    std::vector<DataBlock> blocks = prepareBlocks(blocks_in);
    const int nsample = blocks[0].X.rows();
    if (response.rows() != nsample) {
        throw InputValidationError(fmt::format(
            "Response has {} rows but the blocks have {}", response.rows(), nsample
        ));
    }
    CodedResponse coded = codeResponse(response, options_in.model_type);
    const int nresp = coded.Y.cols();
    const int pcomp_limit = coded.type == ModelType::Discriminant ? nresp - 1 : nresp;
    if (options_in.max_pcomp > pcomp_limit) {
        throw InputValidationError(fmt::format(
            "maxPcomp must be <= {} for this response, got {}", pcomp_limit, options_in.max_pcomp
        ));
    }
    FitOptions options = options_in;
    options.max_ocomp = clampOrthogonalCount(options.max_ocomp, options.max_pcomp, nsample, blocks);
    validateCVSettings(cvSettings(options), nsample, coded.classes);

    progress.log(
        "Consensus OPLS ({}): {} blocks, {} samples, {} kernel, up to {} orthogonal component(s)",
        modelTypeName(coded.type), blocks.size(), nsample, options.kernel.name(), options.max_ocomp
    );
    progress.log(
        "Cross-validation: {}, kernel centering {}, response scaling {}",
        cvTypeName(options.cv_type), options.kernel_centering ? "on" : "off", scalingName(options.y_scaling)
    );
    if (options.max_ocomp != options_in.max_ocomp) {
        progress.log("maxOcomp reduced from {} to {}", options_in.max_ocomp, options.max_ocomp);
    }

    // 2. Fusion, cross-validation, selection and final model
    PipelineStages stages = runPipeline(blocks, coded, options, options.max_ocomp, options.n_workers, progress);

    // 3. Block contributions, loadings and VIP
    ContributionResult contributions = decomposeContributions(
        blocks, stages.fusion.normalized_kernels, stages.model, options.n_workers
    );
    progress.stageDone("Block contributions");

    // 4. Permutation test, one single-threaded pipeline per permutation
    std::optional<PermutationStats> permutation;
    if (options.n_perm > 0) {
        const PermutationSample observed = summarize(stages, coded.type);
        PipelineRunner run = [&](const CodedResponse &permuted) {
            ProgressTracker quiet(false);
            PipelineStages perm = runPipeline(blocks, permuted, options, options.max_ocomp, 1, quiet);
            return summarize(perm, permuted.type);
        };
        permutation = permutationTest(coded, observed, options.n_perm, options.seed, options.n_workers, run);
        progress.stageDone("Permutation test");
    }

    ModelBuilder builder(std::move(blocks), std::move(coded), options);
    builder.fusion(std::move(stages.fusion))
        .crossValidation(std::move(stages.cv))
        .selection(std::move(stages.selection))
        .finalModel(std::move(stages.model))
        .contributions(std::move(contributions));
    if (permutation) {
        for (const PermutationFailure &failure : permutation->failures) {
            builder.warning(fmt::format("Permutation {} failed: {}", failure.permutation + 1, failure.message));
        }
        builder.permutation(std::move(*permutation));
    }
    ConsensusModel model = builder.build();
    for (const std::string &warning : model.warnings()) {
        progress.log("Warning: {}", warning);
    }
    return model;
}

} // namespace ConsensusOPLS
