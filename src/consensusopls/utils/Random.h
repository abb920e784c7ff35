// Copyright 2024 ConsensusOPLS contributors
//
// Licensed under the Apache License, Version 2.0 <LICENSE-APACHE or
// https://www.apache.org/licenses/LICENSE-2.0> or the MIT license
// <LICENSE-MIT or https://opensource.org/licenses/MIT>, at your
// option. This file may not be copied, modified, or distributed
// except according to those terms.

#pragma once

#include <cstdint>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace ConsensusOPLS {

// Independent random streams. Each (seed, stream, index) triple gets its own
// generator so that work items can draw in any order or thread.
enum class RandomStream : std::uint32_t {
    CVSplit = 1,
    Permutation = 2
};

inline std::mt19937_64 makeGenerator(std::uint64_t seed, RandomStream stream, std::uint64_t index) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffu),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(stream),
        static_cast<std::uint32_t>(index & 0xffffffffu),
        static_cast<std::uint32_t>(index >> 32)
    };
    return std::mt19937_64(seq);
}

// Fisher-Yates shuffle of v.
template <typename T>
void shuffleInPlace(std::vector<T> &v, std::mt19937_64 &rng) {
    for (std::size_t i = v.size(); i > 1; i--) {
        std::uniform_int_distribution<std::size_t> pick(0, i - 1);
        std::swap(v[i - 1], v[pick(rng)]);
    }
}

// Random permutation of 0..n-1.
inline std::vector<int> randomPermutation(int n, std::mt19937_64 &rng) {
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    shuffleInPlace(order, rng);
    return order;
}

} // namespace ConsensusOPLS
