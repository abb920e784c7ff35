// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include <catch2/catch.hpp>

#include <cmath>

#include <Eigen/Core>

#include "TestData.h"
#include "consensusopls/kernels/RVFusion.h"
#include "consensusopls/models/Contribution.h"
#include "consensusopls/models/KernelOPLS.h"
#include "consensusopls/models/Response.h"

using namespace ConsensusOPLS;

namespace {

struct FittedBlocks {
    ConsensusOPLS::testing::DiscriminantData data;
    FusionResult fusion;
    KernelOPLSModel model;
};

FittedBlocks fitBlocks(int nox) {
    FittedBlocks f;
    f.data = ConsensusOPLS::testing::threeBlockData(7);
    CodedResponse y = dummyCode(f.data.labels);
    f.fusion = fuseBlocks(f.data.blocks, y.Y, KernelSpec(LinearKernel{}), 1);
    f.model = kernelopls(f.fusion.fused, y.Y, 1, nox);
    return f;
}

} // namespace

TEST_CASE("Component names", "[contribution]") {
    REQUIRE(componentNames(2, 1) == std::vector<std::string>{"p_1", "p_2", "o_1"});
    REQUIRE(componentNames(1, 0) == std::vector<std::string>{"p_1"});
}

TEST_CASE("Block contributions", "[contribution]") {
    FittedBlocks f = fitBlocks(2);
    ContributionResult serial = decomposeContributions(f.data.blocks, f.fusion.normalized_kernels, f.model, 1);
    ContributionResult threaded = decomposeContributions(f.data.blocks, f.fusion.normalized_kernels, f.model, 3);

    REQUIRE(serial.lambda.rows() == 3);
    REQUIRE(serial.lambda.cols() == 3);
    REQUIRE(serial.component_names.back() == "o_2");

    // Normalized linear kernels are positive semi-definite
    REQUIRE((serial.lambda.array() >= 0.0).all());
    for (int a = 0; a < 3; a++) {
        REQUIRE(serial.contribution.col(a).sum() == Approx(1.0));
    }
    // The class-separating block dominates the predictive component
    REQUIRE(serial.contribution(0, 0) > serial.contribution(1, 0));
    REQUIRE(serial.contribution(0, 0) > serial.contribution(2, 0));

    REQUIRE(serial.lambda == threaded.lambda);
    REQUIRE(serial.vip[1] == threaded.vip[1]);
}

TEST_CASE("Block loadings", "[contribution]") {
    FittedBlocks f = fitBlocks(1);
    ContributionResult result = decomposeContributions(f.data.blocks, f.fusion.normalized_kernels, f.model, 2);

    REQUIRE(result.loadings.size() == 3);
    REQUIRE(result.loadings[0].rows() == 50);
    REQUIRE(result.loadings[2].rows() == 10);
    REQUIRE(result.loadings[0].cols() == 2);

    // Column a is X_b' t_a / ||t_a||^2
    Eigen::VectorXd t = f.model.scoresO().col(0);
    Eigen::VectorXd expected = f.data.blocks[1].X.transpose() * t / t.squaredNorm();
    REQUIRE((result.loadings[1].col(1) - expected).norm() < 1e-10);
}

TEST_CASE("Variable importance", "[contribution]") {
    SECTION("squared VIP sums to the number of variables") {
        FittedBlocks f = fitBlocks(2);
        ContributionResult result = decomposeContributions(f.data.blocks, f.fusion.normalized_kernels, f.model, 1);
        for (std::size_t b = 0; b < result.vip.size(); b++) {
            const Eigen::MatrixXd &vip = result.vip[b];
            const double p = vip.rows();
            REQUIRE(vip.cols() == 3);
            for (int g = 0; g < 3; g++) {
                REQUIRE(vip.col(g).squaredNorm() == Approx(p));
            }
        }
        // The shifted variables of the first block matter most for prediction
        const Eigen::VectorXd pred = result.vip[0].col(0);
        REQUIRE(pred.head(10).mean() > pred.tail(40).mean());
    }
    SECTION("no orthogonal components") {
        FittedBlocks f = fitBlocks(0);
        ContributionResult result = decomposeContributions(f.data.blocks, f.fusion.normalized_kernels, f.model, 1);
        REQUIRE(result.lambda.cols() == 1);
        REQUIRE(result.vip[0].col(1).array().isNaN().all());
        REQUIRE(result.vip[0].col(0).allFinite());
    }
}
