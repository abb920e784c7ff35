// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "Kernel.h"

#include <cmath>

#include <fmt/core.h>

#include "../utils/Errors.h"

namespace ConsensusOPLS {

namespace {

void checkPositive(const char *family, const char *param, double value) {
    if (!std::isfinite(value) || value <= 0) {
        throw ConfigurationError(fmt::format(
            "{} kernel parameter '{}' must be a positive finite number, got {}", family, param, value
        ));
    }
}

double requireParam(const std::map<std::string, double> &params, const char *family, const char *param) {
    auto it = params.find(param);
    if (it == params.end()) {
        throw ConfigurationError(fmt::format("{} kernel requires parameter '{}'", family, param));
    }
    return it->second;
}

// Squared euclidean distances between rows: ||a||^2 + ||b||^2 - 2 a.b
Eigen::MatrixXd squaredDistances(const Eigen::MatrixXd &X1, const Eigen::MatrixXd &X2) {
    Eigen::VectorXd n1 = X1.rowwise().squaredNorm();
    Eigen::VectorXd n2 = X2.rowwise().squaredNorm();
    Eigen::MatrixXd D = -2.0 * (X1 * X2.transpose());
    D.colwise() += n1;
    D.rowwise() += n2.transpose();
    // Cancellation can leave tiny negatives on identical rows.
    return D.cwiseMax(0.0);
}

struct KernelEvaluator {
    const Eigen::MatrixXd &X1;
    const Eigen::MatrixXd &X2;

    Eigen::MatrixXd operator()(const LinearKernel &) const { return X1 * X2.transpose(); }

    Eigen::MatrixXd operator()(const PolynomialKernel &k) const {
        Eigen::MatrixXd G = X1 * X2.transpose();
        G.array() += 1.0;
        if (k.order == 1.0) return G;
        return G.array().pow(k.order).matrix();
    }

    Eigen::MatrixXd operator()(const GaussianKernel &k) const {
        Eigen::MatrixXd D = squaredDistances(X1, X2);
        return (-D.array() / (2.0 * k.sigma * k.sigma)).exp().matrix();
    }
};

struct KernelNamer {
    std::string operator()(const LinearKernel &) const { return "linear"; }
    std::string operator()(const PolynomialKernel &) const { return "polynomial"; }
    std::string operator()(const GaussianKernel &) const { return "gaussian"; }
};

struct KernelParamLister {
    std::map<std::string, double> operator()(const LinearKernel &) const { return {}; }
    std::map<std::string, double> operator()(const PolynomialKernel &k) const { return {{"order", k.order}}; }
    std::map<std::string, double> operator()(const GaussianKernel &k) const { return {{"sigma", k.sigma}}; }
};

} // namespace

KernelSpec::KernelSpec() : params_(PolynomialKernel{1.0}) {}

KernelSpec::KernelSpec(LinearKernel k) : params_(k) {}

KernelSpec::KernelSpec(PolynomialKernel k) : params_(k) {
    checkPositive("polynomial", "order", k.order);
}

KernelSpec::KernelSpec(GaussianKernel k) : params_(k) {
    checkPositive("gaussian", "sigma", k.sigma);
}

KernelSpec KernelSpec::fromTag(const std::string &tag, const std::map<std::string, double> &params) {
    if (tag == "linear" || tag == "l") {
        return KernelSpec(LinearKernel{});
    }
    if (tag == "polynomial" || tag == "p") {
        return KernelSpec(PolynomialKernel{requireParam(params, "polynomial", "order")});
    }
    if (tag == "gaussian" || tag == "g") {
        return KernelSpec(GaussianKernel{requireParam(params, "gaussian", "sigma")});
    }
    throw ConfigurationError(fmt::format(
        "Unknown kernel type '{}': expected linear, polynomial or gaussian", tag
    ));
}

std::string KernelSpec::name() const { return std::visit(KernelNamer{}, params_); }

std::map<std::string, double> KernelSpec::paramMap() const { return std::visit(KernelParamLister{}, params_); }

Eigen::MatrixXd buildKernel(const KernelSpec &spec, const Eigen::MatrixXd &X1, const Eigen::MatrixXd &X2) {
    if (X1.cols() != X2.cols()) {
        throw ConfigurationError(fmt::format(
            "Kernel inputs have {} and {} variables", X1.cols(), X2.cols()
        ));
    }
    return std::visit(KernelEvaluator{X1, X2}, spec.params());
}

Eigen::MatrixXd buildKernel(const KernelSpec &spec, const Eigen::MatrixXd &X) {
    Eigen::MatrixXd K = buildKernel(spec, X, X);
    // Symmetrize away rounding differences between K(i,j) and K(j,i).
    return 0.5 * (K + K.transpose());
}

} // namespace ConsensusOPLS
