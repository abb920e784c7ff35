// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <algorithm>
#include <cmath>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace ConsensusOPLS {

// Run fn(i) for every i in [0, n) using at most n_workers threads.
// fn(i) must only write to storage owned by index i; callers reduce the
// per-index results afterwards in ascending index order so that the output
// does not depend on the worker count.
template <typename Fn>
void parallelFor(int n, int n_workers, Fn &&fn) {
    if (n <= 0) return;
    if (n_workers <= 1 || n == 1) {
        for (int i = 0; i < n; i++) fn(i);
        return;
    }
    tbb::task_arena arena(std::min(n_workers, n));
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<int>(0, n, 1),
            [&](const tbb::blocked_range<int> &range) {
                for (int i = range.begin(); i < range.end(); i++) fn(i);
            }
        );
    });
}

struct WorkerSplit {
    int outer; // workers for the outer loop
    int inner; // workers for each inner loop
};

// Split a worker budget between a loop over n_outer items and a nested loop
// over n_inner items. The inner share is the square root of the usable
// workers (capped by n_inner), the outer share takes what is left, so
// outer * inner never exceeds n_workers.
inline WorkerSplit splitWorkers(int n_workers, int n_outer, int n_inner) {
    n_workers = std::max(n_workers, 1);
    const int usable = std::max(std::min(n_outer * n_inner, n_workers), 1);
    int inner = static_cast<int>(std::floor(std::sqrt(static_cast<double>(usable))));
    inner = std::max(std::min(inner, n_inner), 1);
    int outer = std::max(n_workers / inner, 1);
    return {outer, inner};
}

} // namespace ConsensusOPLS
