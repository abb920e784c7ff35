// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <stdexcept>
#include <string>

namespace ConsensusOPLS {

// Bad shapes, tags or counts supplied by the caller. Raised before any
// parallel work is dispatched.
class InputValidationError : public std::invalid_argument {
  public:
    explicit InputValidationError(const std::string &msg) : std::invalid_argument(msg) {}
};

// Unknown kernel family, missing kernel parameter, or prediction blocks that
// do not match the blocks a model was fitted on.
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string &msg) : std::invalid_argument(msg) {}
};

// Zero-norm kernels and singular systems.
class NumericalDegeneracyError : public std::runtime_error {
  public:
    explicit NumericalDegeneracyError(const std::string &msg) : std::runtime_error(msg) {}
};

// No further latent component can be extracted (rank exhausted).
class ConvergenceError : public std::runtime_error {
  public:
    explicit ConvergenceError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace ConsensusOPLS
