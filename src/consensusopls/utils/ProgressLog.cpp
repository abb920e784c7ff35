// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#include "ProgressLog.h"

#include <cstdio>
#include <ctime>
#include <mutex>

namespace ConsensusOPLS {

namespace {

std::mutex &logMutex() {
    static std::mutex m;
    return m;
}

std::string timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm now_tm{};
#if defined(_WIN32)
    localtime_s(&now_tm, &now);
#else
    localtime_r(&now, &now_tm);
#endif
    char buf[24];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &now_tm);
    return buf;
}

} // namespace

void progressWrite(const std::string &message) {
    std::lock_guard<std::mutex> lock(logMutex());
    fmt::print(stderr, "[{}] {}\n", timestamp(), message);
    std::fflush(stderr);
}

std::string formatElapsed(std::chrono::steady_clock::time_point start) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start
    ).count();
    const long long minutes = ms / 60000;
    const double seconds = static_cast<double>(ms % 60000) / 1000.0;
    if (minutes > 0) return fmt::format("{}:{:06.3f}", minutes, seconds);
    return fmt::format("{:.3f}s", seconds);
}

void ProgressTracker::stageDone(const char *stage) {
    if (!enabled_) return;
    progressWrite(fmt::format("{} done ({})", stage, formatElapsed(start_)));
    start_ = std::chrono::steady_clock::now();
}

} // namespace ConsensusOPLS
