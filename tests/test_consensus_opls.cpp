// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "TestData.h"
#include "consensusopls/models/ConsensusOPLS.h"
#include "consensusopls/models/Predict.h"
#include "consensusopls/utils/Errors.h"

using namespace ConsensusOPLS;
using ConsensusOPLS::testing::normalMatrix;
using ConsensusOPLS::testing::sameValues;
using ConsensusOPLS::testing::threeBlockData;

namespace {

FitOptions discriminantOptions() {
    FitOptions options;
    options.max_pcomp = 1;
    options.max_ocomp = 3;
    options.model_type = ModelType::Discriminant;
    options.cv_type = CVType::NFold;
    options.nfold = 5;
    options.kernel = KernelSpec(LinearKernel{});
    return options;
}

} // namespace

TEST_CASE("Three-block discriminant fit", "[consensus]") {
    auto data = threeBlockData();
    ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), discriminantOptions());

    REQUIRE(model.modelType() == ModelType::Discriminant);
    REQUIRE(model.classNames() == std::vector<std::string>{"A", "B"});
    REQUIRE(model.blockNames() == std::vector<std::string>{"metabolomics", "proteomics", "clinical"});
    REQUIRE(model.nPcomp() == 1);
    REQUIRE(model.maxOcomp() == 3);
    REQUIRE(model.nOcomp() >= 1);
    REQUIRE(model.nOcomp() <= 3);
    REQUIRE(model.kernel().name() == "linear");

    const Eigen::VectorXd &rv = model.rvWeights();
    REQUIRE(rv.size() == 3);
    REQUIRE((rv.array() >= 0.0).all());
    REQUIRE((rv.array() <= 1.0).all());
    REQUIRE(rv(0) > rv(1));
    REQUIRE(rv(0) > rv(2));

    const int ncol = 1 + model.nOcomp();
    REQUIRE(model.scores().rows() == 20);
    REQUIRE(model.scores().cols() == ncol);
    REQUIRE(model.componentNames().size() == static_cast<std::size_t>(ncol));
    REQUIRE(model.blockContribution().rows() == 3);
    for (int a = 0; a < ncol; a++) {
        REQUIRE(model.blockContribution().col(a).sum() == Approx(1.0).margin(1e-9));
    }
    REQUIRE(model.loadings()[0].rows() == 50);
    REQUIRE(model.vip()[1].rows() == 30);

    REQUIRE(model.Q2Yhat().size() == 4);
    REQUIRE(model.DQ2().rows() == 4);
    REQUIRE(model.DQ2().cols() == 2);
    for (int k = 0; k <= 3; k++) {
        REQUIRE(model.DQ2()(k, 0) >= -1.0);
        REQUIRE(model.DQ2()(k, 0) <= 1.0);
        REQUIRE(model.Q2Yhat()(k) >= -1.0);
        REQUIRE(model.Q2Yhat()(k) <= 1.0);
    }
    REQUIRE(model.selection().curve(model.nOcomp()) > 0.5);
    REQUIRE(model.selection().cv_classification.mean_sensitivity >= 0.8);
    REQUIRE(model.R2Yhat().size() == model.nOcomp() + 1);
    REQUIRE(model.fittedValues().rows() == 20);
    REQUIRE(model.crossValidation().folds.size() == 5);
    REQUIRE(model.crossValidation().all_yhat.cols() == 8);
    REQUIRE_FALSE(model.permutation().has_value());
}

TEST_CASE("Row count mismatch is rejected", "[consensus]") {
    auto data = threeBlockData();
    data.blocks[1].X = normalMatrix(19, 30, 5);
    REQUIRE_THROWS_AS(
        fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), discriminantOptions()),
        InputValidationError
    );
}

TEST_CASE("Orthogonal count is clamped to the data", "[consensus]") {
    auto data = threeBlockData();
    for (DataBlock &block : data.blocks) {
        block.X = block.X.leftCols(2).eval();
        block.variable_names.clear();
    }
    FitOptions options = discriminantOptions();
    options.max_ocomp = 5;
    options.verbose = true;
    ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), options);

    REQUIRE(model.maxOcomp() == 2);
    REQUIRE(model.options().max_ocomp == 2);
    REQUIRE(model.Q2Yhat().size() == 3);
    REQUIRE(model.nOcomp() <= 2);

    REQUIRE(clampOrthogonalCount(5, 1, 20, data.blocks) == 2);
    REQUIRE(clampOrthogonalCount(30, 1, 6, threeBlockData().blocks) == 5);
    REQUIRE(clampOrthogonalCount(0, 1, 20, data.blocks) == 0);
}

TEST_CASE("Orthogonal count falls back to zero when no round can fit one", "[consensus]") {
    auto data = threeBlockData();
    DataBlock single;
    single.name = "marker";
    single.X = normalMatrix(20, 1, 31);
    for (int i = 0; i < 20; i++) single.X(i, 0) += data.labels[i] == "A" ? 2.0 : -2.0;

    FitOptions options = discriminantOptions();
    ConsensusModel model = fitConsensusOPLS({single}, Response::fromLabels(data.labels), options);

    REQUIRE(model.maxOcomp() == 1);
    REQUIRE(std::isnan(model.selection().curve(1)));
    REQUIRE(model.nOcomp() == 0);
    REQUIRE(model.scoresO().cols() == 0);
    REQUIRE(model.blockContribution()(0, 0) == Approx(1.0).margin(1e-9));
    REQUIRE_FALSE(model.crossValidation().failures.empty());
    REQUIRE_FALSE(model.warnings().empty());
}

TEST_CASE("Fits are reproducible across worker counts", "[consensus]") {
    auto data = threeBlockData(3);
    FitOptions options = discriminantOptions();
    options.cv_type = CVType::MCCVB;
    options.n_mc = 8;
    options.seed = 42;

    options.n_workers = 1;
    ConsensusModel a = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), options);
    options.n_workers = 3;
    ConsensusModel b = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), options);

    REQUIRE(a.nOcomp() == b.nOcomp());
    REQUIRE(a.rvWeights() == b.rvWeights());
    REQUIRE(sameValues(a.crossValidation().all_yhat, b.crossValidation().all_yhat));
    REQUIRE(sameValues(a.DQ2(), b.DQ2()));
    REQUIRE(sameValues(a.scores(), b.scores()));
    REQUIRE(sameValues(a.blockContribution(), b.blockContribution()));
}

TEST_CASE("Permutation statistics", "[consensus]") {
    auto data = threeBlockData();
    FitOptions options = discriminantOptions();
    ConsensusModel plain = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), options);

    options.n_perm = 3;
    options.n_workers = 2;
    ConsensusModel permuted = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), options);

    // Permutations leave the model itself unchanged
    REQUIRE(plain.nOcomp() == permuted.nOcomp());
    REQUIRE(sameValues(plain.scores(), permuted.scores()));
    REQUIRE(sameValues(plain.Q2Yhat(), permuted.Q2Yhat()));

    REQUIRE(permuted.permutation().has_value());
    const PermutationStats &stats = *permuted.permutation();
    const int k = permuted.nOcomp();
    REQUIRE(stats.r2_yhat.size() == 4);
    REQUIRE(stats.r2_yhat(0) == permuted.R2Yhat()(k));
    REQUIRE(stats.q2_yhat(0) == permuted.Q2Yhat()(k));
    REQUIRE(stats.dq2(0) == permuted.selection().curve(k));
    REQUIRE(stats.p_dq2 >= 0.25);
    REQUIRE(stats.p_dq2 <= 1.0);
}

TEST_CASE("Predicting the training blocks reproduces the fit", "[consensus][predict]") {
    auto data = threeBlockData();
    ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), discriminantOptions());
    ConsensusPrediction pred = predictConsensusOPLS(model, data.blocks);

    const Eigen::MatrixXd &fitted = model.fittedValues();
    REQUIRE((pred.Yhat - fitted).norm() < 1e-8 * (1.0 + fitted.norm()));
    REQUIRE((pred.Tp - model.scoresP()).norm() < 1e-8 * (1.0 + model.scoresP().norm()));
    REQUIRE(pred.To.cols() == model.nOcomp());

    REQUIRE(pred.classes == argMaxClasses(fitted));
    int correct = 0;
    for (int i = 0; i < 20; i++) {
        if (pred.class_labels[i] == data.labels[i]) correct++;
        REQUIRE(pred.probabilities.row(i).sum() == Approx(1.0));
        REQUIRE(pred.margin(i) >= 0.0);
    }
    REQUIRE(correct >= 18);
}

TEST_CASE("Prediction blocks must match the fitted blocks", "[consensus][predict]") {
    auto data = threeBlockData();
    ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromLabels(data.labels), discriminantOptions());

    auto fresh = threeBlockData(99);
    for (DataBlock &block : fresh.blocks) block.X = block.X.topRows(4).eval();
    ConsensusPrediction pred = predictConsensusOPLS(model, fresh.blocks);
    REQUIRE(pred.Yhat.rows() == 4);
    REQUIRE(pred.class_labels.size() == 4);

    std::vector<DataBlock> missing(fresh.blocks.begin(), fresh.blocks.begin() + 2);
    REQUIRE_THROWS_AS(predictConsensusOPLS(model, missing), ConfigurationError);

    std::vector<DataBlock> renamed = fresh.blocks;
    renamed[2].name = "imaging";
    REQUIRE_THROWS_AS(predictConsensusOPLS(model, renamed), ConfigurationError);

    std::vector<DataBlock> narrow = fresh.blocks;
    narrow[1].X = narrow[1].X.leftCols(29).eval();
    REQUIRE_THROWS_AS(predictConsensusOPLS(model, narrow), ConfigurationError);

    std::vector<DataBlock> relabeled = fresh.blocks;
    relabeled[0].variable_names[0] = "other";
    REQUIRE_THROWS_AS(predictConsensusOPLS(model, relabeled), ConfigurationError);

    std::vector<DataBlock> ragged = fresh.blocks;
    ragged[2].X = normalMatrix(3, 10, 5);
    REQUIRE_THROWS_AS(predictConsensusOPLS(model, ragged), InputValidationError);
}

TEST_CASE("Regression fit with the default kernel", "[consensus]") {
    auto data = threeBlockData(11);
    Eigen::VectorXd y = data.blocks[0].X.leftCols(10).rowwise().mean() + 0.1 * normalMatrix(20, 1, 12).col(0);

    FitOptions options;
    options.model_type = ModelType::Regression;
    options.max_ocomp = 2;
    options.nfold = 4;
    ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromVector(y), options);

    REQUIRE(model.modelType() == ModelType::Regression);
    REQUIRE(model.kernel().name() == "polynomial");
    REQUIRE(model.classNames().empty());
    REQUIRE(model.DQ2().size() == 0);
    REQUIRE(model.Q2Yhat().size() == 3);
    REQUIRE(model.Q2Yhat()(model.nOcomp()) > 0.5);
    REQUIRE(model.R2Y() <= 1.0);

    ConsensusPrediction pred = predictConsensusOPLS(model, data.blocks);
    REQUIRE((pred.Yhat - model.fittedValues()).norm() < 1e-8 * (1.0 + model.fittedValues().norm()));
    REQUIRE(pred.class_labels.empty());
}

TEST_CASE("Fit arguments are validated", "[consensus]") {
    auto data = threeBlockData();
    const Response labels = Response::fromLabels(data.labels);

    SECTION("too many predictive components for two classes") {
        FitOptions options = discriminantOptions();
        options.max_pcomp = 2;
        REQUIRE_THROWS_AS(fitConsensusOPLS(data.blocks, labels, options), InputValidationError);
    }
    SECTION("class-balanced splits need classes") {
        FitOptions options = discriminantOptions();
        options.model_type = ModelType::Regression;
        options.cv_type = CVType::MCCVB;
        REQUIRE_THROWS_AS(
            fitConsensusOPLS(data.blocks, Response::fromVector(Eigen::VectorXd::LinSpaced(20, 0, 1)), options),
            InputValidationError
        );
    }
    SECTION("worker count") {
        FitOptions options = discriminantOptions();
        options.n_workers = 0;
        REQUIRE_THROWS_AS(fitConsensusOPLS(data.blocks, labels, options), InputValidationError);
    }
    SECTION("empty block list") {
        REQUIRE_THROWS_AS(fitConsensusOPLS({}, labels, discriminantOptions()), InputValidationError);
    }
    SECTION("response length") {
        std::vector<std::string> short_labels(data.labels.begin(), data.labels.begin() + 18);
        REQUIRE_THROWS_AS(
            fitConsensusOPLS(data.blocks, Response::fromLabels(short_labels), discriminantOptions()),
            InputValidationError
        );
    }
    SECTION("single class") {
        std::vector<std::string> one(20, "A");
        REQUIRE_THROWS_AS(
            fitConsensusOPLS(data.blocks, Response::fromLabels(one), discriminantOptions()),
            InputValidationError
        );
    }
    SECTION("non-finite data") {
        data.blocks[2].X(3, 4) = std::nan("");
        REQUIRE_THROWS_AS(fitConsensusOPLS(data.blocks, labels, discriminantOptions()), InputValidationError);
    }
    SECTION("duplicate block names") {
        data.blocks[2].name = data.blocks[1].name;
        REQUIRE_THROWS_AS(fitConsensusOPLS(data.blocks, labels, discriminantOptions()), InputValidationError);
    }
    SECTION("numeric class codes") {
        Eigen::VectorXd codes(20);
        for (int i = 0; i < 20; i++) codes(i) = i % 2 == 0 ? 1.0 : 2.0;
        ConsensusModel model = fitConsensusOPLS(data.blocks, Response::fromVector(codes), discriminantOptions());
        REQUIRE(model.classNames() == std::vector<std::string>{"1", "2"});
    }
}

TEST_CASE("Unnamed blocks get default names", "[consensus]") {
    auto data = threeBlockData();
    for (DataBlock &block : data.blocks) block.name.clear();
    std::vector<DataBlock> prepared = prepareBlocks(data.blocks);
    REQUIRE(prepared[0].name == "block_1");
    REQUIRE(prepared[2].name == "block_3");
}

TEST_CASE("Models are only built from complete stages", "[consensus]") {
    auto data = threeBlockData();
    ModelBuilder builder(data.blocks, dummyCode(data.labels), FitOptions());
    REQUIRE_THROWS_AS(builder.build(), std::logic_error);
}
