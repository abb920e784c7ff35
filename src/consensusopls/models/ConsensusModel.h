// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "../kernels/Kernel.h"
#include "../kernels/RVFusion.h"
#include "../validation/ComponentSelection.h"
#include "../validation/CrossValidation.h"
#include "../validation/Permutation.h"
#include "Contribution.h"
#include "KernelOPLS.h"
#include "Response.h"

namespace ConsensusOPLS {

struct FitOptions {
    int max_pcomp = 1;           // predictive components
    int max_ocomp = 5;           // largest orthogonal count tried in cross-validation
    ModelType model_type = ModelType::Discriminant;
    CVType cv_type = CVType::NFold;
    int nfold = 5;
    int n_mc = 100;
    double cv_frac = 4.0 / 5.0;
    KernelSpec kernel;           // polynomial, order 1
    bool kernel_centering = true;
    Scaling y_scaling = Scaling::Center;
    int n_workers = 1;
    int n_perm = 0;
    std::uint64_t seed = 0;
    bool verbose = false;
};

// Fitted consensus OPLS model. Instances are only produced by ModelBuilder
// and never change afterwards.
class ConsensusModel {
  public:
    ModelType modelType() const { return options_.model_type; }
    const FitOptions &options() const { return options_; }
    const KernelSpec &kernel() const { return options_.kernel; }

    // Response used for modeling (indicator matrix for discriminant models)
    const Eigen::MatrixXd &response() const { return response_.Y; }
    const std::vector<std::string> &classNames() const { return response_.class_names; }
    const std::vector<int> &classes() const { return response_.classes; }

    int nPcomp() const { return kopls_.ncomp; }
    int nOcomp() const { return kopls_.nox; }
    int maxOcomp() const { return cv_.max_ocomp; }
    int nSamples() const { return response_.Y.rows(); }

    const std::vector<DataBlock> &blocks() const { return blocks_; }
    std::vector<std::string> blockNames() const;

    const Eigen::VectorXd &rvWeights() const { return fusion_.rv; }
    const Eigen::VectorXd &kernelNorms() const { return fusion_.kernel_norms; }
    const std::vector<Eigen::MatrixXd> &normalizedKernels() const { return fusion_.normalized_kernels; }
    const Eigen::MatrixXd &fusedKernel() const { return fusion_.fused; }

    const std::vector<std::string> &componentNames() const { return contributions_.component_names; }
    const Eigen::MatrixXd &lambda() const { return contributions_.lambda; }
    const Eigen::MatrixXd &blockContribution() const { return contributions_.contribution; }
    const std::vector<Eigen::MatrixXd> &loadings() const { return contributions_.loadings; }
    const std::vector<Eigen::MatrixXd> &vip() const { return contributions_.vip; }

    // n × (A + nox): predictive scores, then orthogonal scores
    Eigen::MatrixXd scores() const;
    const Eigen::MatrixXd &scoresP() const { return kopls_.scoresP(); }
    const Eigen::MatrixXd &scoresO() const { return kopls_.scoresO(); }

    const Eigen::VectorXd &R2X() const { return kopls_.R2X; }
    const Eigen::VectorXd &R2XO() const { return kopls_.R2XO; }
    const Eigen::VectorXd &R2XC() const { return kopls_.R2XC; }
    const Eigen::VectorXd &R2Yhat() const { return kopls_.R2Yhat; }
    double R2Y() const { return kopls_.R2Y; }
    const Eigen::VectorXd &Q2Yhat() const { return cv_.q2_yhat; }
    const Eigen::MatrixXd &DQ2() const { return selection_.dq2; }
    const Eigen::MatrixXd &fittedValues() const { return kopls_.fitted_values; }

    const KernelOPLSModel &koplsModel() const { return kopls_; }
    const CVResult &crossValidation() const { return cv_; }
    const SelectionResult &selection() const { return selection_; }
    const std::optional<PermutationStats> &permutation() const { return permutation_; }

    const std::vector<std::string> &warnings() const { return warnings_; }

  private:
    friend class ModelBuilder;
    ConsensusModel() = default;

    FitOptions options_;
    std::vector<DataBlock> blocks_;
    CodedResponse response_;
    FusionResult fusion_;
    CVResult cv_;
    SelectionResult selection_;
    KernelOPLSModel kopls_;
    ContributionResult contributions_;
    std::optional<PermutationStats> permutation_;
    std::vector<std::string> warnings_;
};

// Collects the per-stage results of a fit and assembles the model.
class ModelBuilder {
  public:
    ModelBuilder(std::vector<DataBlock> blocks, CodedResponse response, FitOptions options);

    ModelBuilder &fusion(FusionResult fusion);
    ModelBuilder &crossValidation(CVResult cv);
    ModelBuilder &selection(SelectionResult selection);
    ModelBuilder &finalModel(KernelOPLSModel model);
    ModelBuilder &contributions(ContributionResult contributions);
    ModelBuilder &permutation(PermutationStats stats);
    ModelBuilder &warning(std::string message);

    // Throws std::logic_error if a required stage was not supplied.
    ConsensusModel build();

  private:
    ConsensusModel model_;
    bool has_fusion_ = false;
    bool has_cv_ = false;
    bool has_selection_ = false;
    bool has_final_ = false;
    bool has_contributions_ = false;
};

} // namespace ConsensusOPLS
