// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "CrossValidation.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "../utils/Errors.h"
#include "../utils/Parallel.h"
#include "../utils/Random.h"

namespace ConsensusOPLS {

CVType parseCVType(const std::string &tag) {
    if (tag == "nfold") return CVType::NFold;
    if (tag == "mccv") return CVType::MCCV;
    if (tag == "mccvb") return CVType::MCCVB;
    throw InputValidationError(fmt::format("cvType must be 'nfold', 'mccv' or 'mccvb', got '{}'", tag));
}

std::string cvTypeName(CVType type) {
    switch (type) {
    case CVType::NFold: return "nfold";
    case CVType::MCCV: return "mccv";
    case CVType::MCCVB: return "mccvb";
    }
    return "nfold";
}

int cvRounds(const CVSettings &settings) {
    return settings.type == CVType::NFold ? settings.nfold : settings.n_mc;
}

void validateCVSettings(const CVSettings &settings, int nsample, const std::vector<int> &classes) {
    if (settings.type == CVType::NFold) {
        if (settings.nfold < 2 || settings.nfold > nsample) {
            throw InputValidationError(fmt::format(
                "nfold must be in [2, {}], got {}", nsample, settings.nfold
            ));
        }
        return;
    }
    if (settings.n_mc < 1) {
        throw InputValidationError(fmt::format("nMC must be >= 1, got {}", settings.n_mc));
    }
    if (!(settings.cv_frac > 0) || !(settings.cv_frac < 1)) {
        throw InputValidationError(fmt::format("cvFrac must be in (0, 1), got {}", settings.cv_frac));
    }
    if (settings.type == CVType::MCCVB) {
        if (classes.empty()) {
            throw InputValidationError("cvType 'mccvb' requires modelType 'da'");
        }
        return;
    }
    const int ntrain = static_cast<int>(std::floor(nsample * settings.cv_frac));
    if (ntrain < 2 || ntrain >= nsample) {
        throw InputValidationError(fmt::format(
            "cvFrac {} leaves {} training and {} test samples out of {}",
            settings.cv_frac, ntrain, nsample - ntrain, nsample
        ));
    }
}

CVFold makeFold(const CVSettings &settings, int nsample, const std::vector<int> &classes, int round) {
    CVFold fold;
    if (settings.type == CVType::NFold) {
        for (int i = 0; i < nsample; i++) {
            if (i % settings.nfold == round) fold.test.push_back(i);
            else fold.train.push_back(i);
        }
        return fold;
    }

    std::mt19937_64 rng = makeGenerator(settings.seed, RandomStream::CVSplit, round);
    if (settings.type == CVType::MCCV) {
        std::vector<int> order = randomPermutation(nsample, rng);
        const int ntrain = static_cast<int>(std::floor(nsample * settings.cv_frac));
        fold.train.assign(order.begin(), order.begin() + ntrain);
        fold.test.assign(order.begin() + ntrain, order.end());
    } else {
        // Class-balanced: draw the training share within every class.
        const int nclass = classes.empty() ? 0 : *std::max_element(classes.begin(), classes.end()) + 1;
        for (int c = 0; c < nclass; c++) {
            std::vector<int> members;
            for (int i = 0; i < nsample; i++) {
                if (classes[i] == c) members.push_back(i);
            }
            if (members.empty()) continue;
            shuffleInPlace(members, rng);
            const int nc = members.size();
            int ntrain = static_cast<int>(std::floor(nc * settings.cv_frac));
            ntrain = std::max(ntrain, 1);
            if (nc > 1) ntrain = std::min(ntrain, nc - 1);
            fold.train.insert(fold.train.end(), members.begin(), members.begin() + ntrain);
            fold.test.insert(fold.test.end(), members.begin() + ntrain, members.end());
        }
    }
    std::sort(fold.train.begin(), fold.train.end());
    std::sort(fold.test.begin(), fold.test.end());
    return fold;
}

std::vector<CVFold> makePartition(const CVSettings &settings, int nsample, const std::vector<int> &classes) {
    const int nrounds = cvRounds(settings);
    std::vector<CVFold> folds;
    folds.reserve(nrounds);
    for (int r = 0; r < nrounds; r++) {
        folds.push_back(makeFold(settings, nsample, classes, r));
    }
    return folds;
}

Eigen::MatrixXd CVResult::yhat(int k) const {
    const int c = y_test.cols();
    return all_yhat.middleCols(k * c, c);
}

double q2Statistic(const Eigen::MatrixXd &y, const Eigen::MatrixXd &yhat, const Eigen::VectorXd &y_means) {
    double press = 0;
    double tss = 0;
    int used = 0;
    for (int i = 0; i < y.rows(); i++) {
        if (!yhat.row(i).allFinite()) continue;
        press += (y.row(i) - yhat.row(i)).squaredNorm();
        tss += (y.row(i) - y_means.transpose()).squaredNorm();
        used++;
    }
    if (used == 0 || !(tss > 0)) return std::numeric_limits<double>::quiet_NaN();
    return 1.0 - press / tss;
}

CVResult crossValidate(
    const Eigen::MatrixXd &K,
    const Eigen::MatrixXd &Y,
    const std::vector<int> &classes,
    int max_pcomp,
    int max_ocomp,
    const CVSettings &settings,
    const KernelOPLSOptions &options,
    int n_workers
) {
    const int n = K.rows();
    const int nresp = Y.cols();
    const int ncounts = max_ocomp + 1;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CVResult result;
    result.max_pcomp = max_pcomp;
    result.max_ocomp = max_ocomp;

    // 1. Partition
    validateCVSettings(settings, n, classes);
    result.folds = makePartition(settings, n, classes);
    const int nrounds = result.folds.size();

    // 2. Fit every (round, k) cell independently
    const int ncells = nrounds * ncounts;
    std::vector<Eigen::MatrixXd> cell_yhat(ncells);
    std::vector<std::string> cell_error(ncells);
    parallelFor(ncells, n_workers, [&](int cell) {
        const int round = cell / ncounts;
        const int k = cell % ncounts;
        const CVFold &fold = result.folds[round];
        try {
            Eigen::MatrixXd KtrTr = K(fold.train, fold.train);
            Eigen::MatrixXd KteTr = K(fold.test, fold.train);
            Eigen::MatrixXd Ytr = Y(fold.train, Eigen::all);
            KernelOPLSModel model = kernelopls(KtrTr, Ytr, max_pcomp, k, options);
            cell_yhat[cell] = kerneloplsPredict(model, KteTr, k, true).Yhat;
        } catch (const ConvergenceError &e) {
            cell_error[cell] = e.what();
        } catch (const NumericalDegeneracyError &e) {
            cell_error[cell] = e.what();
        }
        if (!cell_error[cell].empty()) {
            cell_yhat[cell] = Eigen::MatrixXd::Constant(fold.test.size(), nresp, nan);
        }
    });

    // 3. Stack held-out predictions by round, then by k
    int total = 0;
    for (const CVFold &fold : result.folds) total += fold.test.size();
    result.all_yhat.resize(total, ncounts * nresp);
    result.y_test.resize(total, nresp);
    result.test_index.reserve(total);
    int row = 0;
    for (int r = 0; r < nrounds; r++) {
        const CVFold &fold = result.folds[r];
        const int nte = fold.test.size();
        for (int k = 0; k < ncounts; k++) {
            const int cell = r * ncounts + k;
            result.all_yhat.block(row, k * nresp, nte, nresp) = cell_yhat[cell];
            if (!cell_error[cell].empty()) {
                result.failures.push_back({r, k, cell_error[cell]});
            }
        }
        result.y_test.middleRows(row, nte) = Y(fold.test, Eigen::all);
        result.test_index.insert(result.test_index.end(), fold.test.begin(), fold.test.end());
        row += nte;
    }

    // 4. Q2 per number of orthogonal components
    Eigen::VectorXd y_means = Y.colwise().mean().transpose();
    result.q2_yhat.resize(ncounts);
    result.q2_yhat_vars.resize(ncounts, nresp);
    result.press.resize(ncounts);
    for (int k = 0; k < ncounts; k++) {
        Eigen::MatrixXd yhat_k = result.yhat(k);
        result.q2_yhat(k) = q2Statistic(result.y_test, yhat_k, y_means);
        for (int j = 0; j < nresp; j++) {
            result.q2_yhat_vars(k, j) = q2Statistic(result.y_test.col(j), yhat_k.col(j), y_means.segment(j, 1));
        }
        double press = 0;
        int finite_rows = 0;
        for (int i = 0; i < total; i++) {
            if (!yhat_k.row(i).allFinite()) continue;
            press += (result.y_test.row(i) - yhat_k.row(i)).squaredNorm();
            finite_rows++;
        }
        result.press(k) = finite_rows > 0 ? press : nan;
        if (finite_rows == 0) {
            result.warnings.push_back(fmt::format(
                "No finite cross-validated prediction with {} orthogonal component(s); Q2 is NaN", k
            ));
        }
    }
    for (int r = 0; r < nrounds; r++) {
        bool all_failed = true;
        for (int k = 0; k < ncounts && all_failed; k++) {
            all_failed = !cell_error[r * ncounts + k].empty();
        }
        if (all_failed) {
            result.warnings.push_back(fmt::format("Every model failed in cross-validation round {}", r + 1));
        }
    }
    return result;
}

} // namespace ConsensusOPLS
