// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "ComponentSelection.h"

#include <cmath>
#include <limits>

#include "../utils/Parallel.h"

namespace ConsensusOPLS {

DQ2Value dq2Statistic(const Eigen::VectorXd &yhat, const Eigen::VectorXd &y) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    double sum = 0;
    int used = 0;
    for (int i = 0; i < y.size(); i++) {
        if (!std::isfinite(yhat(i))) continue;
        sum += y(i);
        used++;
    }
    if (used == 0) return {nan, nan};
    const double mean = sum / used;

    double pressd = 0;
    double tss = 0;
    for (int i = 0; i < y.size(); i++) {
        if (!std::isfinite(yhat(i))) continue;
        const double e = yhat(i) - y(i);
        // Predictions beyond the class label are not penalized.
        if ((y(i) == 0.0 && e > 0) || (y(i) == 1.0 && e < 0)) {
            pressd += e * e;
        }
        tss += (y(i) - mean) * (y(i) - mean);
    }
    if (!(tss > 0)) return {nan, pressd};
    return {1.0 - pressd / tss, pressd};
}

int selectOrthogonalCount(const Eigen::VectorXd &curve, int max_ocomp) {
    // A count whose cross-validated value is missing could not be fitted
    if (max_ocomp <= 0 || !std::isfinite(curve(1))) return 0;
    int k = 1;
    while (k < max_ocomp) {
        const double gain = curve(k + 1) - curve(k);
        if (std::isnan(gain) || !(gain > kSelectionImprovement)) break;
        k++;
    }
    return k;
}

ClassificationStats classificationStats(const std::vector<int> &truth, const std::vector<int> &pred, int nclass) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ClassificationStats stats;
    stats.confusion = Eigen::MatrixXi::Zero(nclass, nclass);
    stats.n_excluded = 0;
    for (std::size_t i = 0; i < truth.size(); i++) {
        if (pred[i] < 0) {
            stats.n_excluded++;
            continue;
        }
        stats.confusion(truth[i], pred[i])++;
    }

    const int total = stats.confusion.sum();
    stats.sensitivity.resize(nclass);
    stats.specificity.resize(nclass);
    for (int c = 0; c < nclass; c++) {
        const int tp = stats.confusion(c, c);
        const int fn = stats.confusion.row(c).sum() - tp;
        const int fp = stats.confusion.col(c).sum() - tp;
        const int tn = total - tp - fn - fp;
        stats.sensitivity(c) = tp + fn > 0 ? static_cast<double>(tp) / (tp + fn) : nan;
        stats.specificity(c) = tn + fp > 0 ? static_cast<double>(tn) / (tn + fp) : nan;
    }
    stats.mean_sensitivity = stats.sensitivity.mean();
    stats.mean_specificity = stats.specificity.mean();
    return stats;
}

SelectionResult selectComponents(const CVResult &cv, ModelType type, int n_workers) {
    SelectionResult result;
    const int ncounts = cv.max_ocomp + 1;
    const int nresp = cv.y_test.cols();

    if (type == ModelType::Regression) {
        result.curve = cv.q2_yhat;
        result.n_ocomp = selectOrthogonalCount(result.curve, cv.max_ocomp);
        return result;
    }

    // DQ2 for every (k, response column) cell
    result.dq2.resize(ncounts, nresp);
    result.pressd.resize(ncounts, nresp);
    WorkerSplit split = splitWorkers(n_workers, ncounts, nresp);
    parallelFor(ncounts, split.outer, [&](int k) {
        const Eigen::MatrixXd yhat_k = cv.yhat(k);
        parallelFor(nresp, split.inner, [&](int j) {
            DQ2Value v = dq2Statistic(yhat_k.col(j), cv.y_test.col(j));
            result.dq2(k, j) = v.dq2;
            result.pressd(k, j) = v.pressd;
        });
    });
    result.curve = result.dq2.rowwise().mean();
    result.n_ocomp = selectOrthogonalCount(result.curve, cv.max_ocomp);

    // Held-out classification at the selected size
    const Eigen::MatrixXd yhat_opt = cv.yhat(result.n_ocomp);
    std::vector<int> truth = argMaxClasses(cv.y_test);
    std::vector<int> pred(truth.size(), -1);
    for (int i = 0; i < yhat_opt.rows(); i++) {
        if (!yhat_opt.row(i).allFinite()) continue;
        Eigen::Index best = 0;
        yhat_opt.row(i).maxCoeff(&best);
        pred[i] = best;
    }
    result.cv_classification = classificationStats(truth, pred, nresp);
    return result;
}

} // namespace ConsensusOPLS
