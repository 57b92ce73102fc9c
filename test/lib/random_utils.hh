/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <random>
#include <seastar/core/sstring.hh>

namespace tests::random {

inline std::default_random_engine& gen() {
    static thread_local std::default_random_engine the_gen(std::random_device{}());
    return the_gen;
}

template <typename T>
T get_int(T min, T max) {
    std::uniform_int_distribution<T> dist(min, max);
    return dist(gen());
}

inline seastar::sstring get_bytes(size_t n) {
    seastar::sstring ret = seastar::uninitialized_string(n);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& c : ret) {
        c = static_cast<char>(dist(gen()));
    }
    return ret;
}

} // namespace tests::random
