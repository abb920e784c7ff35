// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace ConsensusOPLS {

// Write "[YYYY-mm-dd HH:MM:SS] message" to stderr.
void progressWrite(const std::string &message);

// Elapsed wall-clock time since start, as "ss.mmm" or "mm:ss.mmm".
std::string formatElapsed(std::chrono::steady_clock::time_point start);

// Stage timer that only logs when enabled. Used by the fit pipeline when
// FitOptions::verbose is set.
class ProgressTracker {
  public:
    explicit ProgressTracker(bool enabled) : enabled_(enabled), start_(std::chrono::steady_clock::now()) {}

    template <typename... Args>
    void log(fmt::format_string<Args...> format, Args &&...args) {
        if (!enabled_) return;
        progressWrite(fmt::format(format, std::forward<Args>(args)...));
    }

    // Log "<stage> done (elapsed)" and restart the stage clock.
    void stageDone(const char *stage);

    bool enabled() const { return enabled_; }

  private:
    bool enabled_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace ConsensusOPLS
