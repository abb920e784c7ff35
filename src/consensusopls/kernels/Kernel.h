// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <map>
#include <string>
#include <variant>

#include <Eigen/Core>

namespace ConsensusOPLS {

// K(x, y) = x'y
struct LinearKernel {};

// K(x, y) = (x'y + 1)^order
struct PolynomialKernel {
    double order;
};

// K(x, y) = exp(-||x - y||^2 / (2 sigma^2))
struct GaussianKernel {
    double sigma;
};

using KernelParams = std::variant<LinearKernel, PolynomialKernel, GaussianKernel>;

// Validated kernel family plus its parameters. Parameters are checked once
// here, never at evaluation time.
class KernelSpec {
  public:
    // Polynomial kernel of order 1, the default of the consensus method.
    KernelSpec();
    KernelSpec(LinearKernel k);
    KernelSpec(PolynomialKernel k);
    KernelSpec(GaussianKernel k);

    // Build from a family tag ("linear"/"l", "polynomial"/"p",
    // "gaussian"/"g") and named parameters ("order", "sigma").
    // Throws ConfigurationError for unknown tags, missing or invalid
    // parameters.
    static KernelSpec fromTag(const std::string &tag, const std::map<std::string, double> &params);

    const KernelParams &params() const { return params_; }
    std::string name() const;
    // Parameter values by name, e.g. {"order": 2}; empty for linear.
    std::map<std::string, double> paramMap() const;

  private:
    KernelParams params_;
};

// Kernel between the rows of X1 (n1 x p) and X2 (n2 x p): n1 x n2.
Eigen::MatrixXd buildKernel(const KernelSpec &spec, const Eigen::MatrixXd &X1, const Eigen::MatrixXd &X2);

// Symmetric n x n training kernel of X.
Eigen::MatrixXd buildKernel(const KernelSpec &spec, const Eigen::MatrixXd &X);

} // namespace ConsensusOPLS
