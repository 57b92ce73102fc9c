/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cstdint>

#include "tus/buffer_pool.hh"

using namespace seastar;

namespace tus {

static bool is_aligned(const char* p, size_t alignment) noexcept {
    return (reinterpret_cast<uintptr_t>(p) & (alignment - 1)) == 0;
}

buffer_pool::handle buffer_pool::acquire(size_t size, size_t alignment) {
    auto it = _idle.find(size);
    if (it != _idle.end()) {
        auto& bufs = it->second;
        while (!bufs.empty()) {
            auto buf = std::move(bufs.back());
            bufs.pop_back();
            if (is_aligned(buf.get(), alignment)) {
                return handle(*this, std::move(buf));
            }
        }
    }
    return handle(*this, temporary_buffer<char>::aligned(alignment, size));
}

void buffer_pool::release(temporary_buffer<char> buf) noexcept {
    if (buf.empty()) {
        return;
    }
    auto size = buf.size();
    try {
        auto& bufs = _idle[size];
        if (bufs.size() < _capacity) {
            bufs.push_back(std::move(buf));
        }
    } catch (const std::bad_alloc&) {
        // buf is freed on return
    }
}

size_t buffer_pool::idle_count(size_t size) const noexcept {
    auto it = _idle.find(size);
    return it == _idle.end() ? 0 : it->second.size();
}

} // namespace tus
