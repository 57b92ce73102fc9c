/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <unordered_map>
#include <utility>
#include <vector>
#include <seastar/core/temporary_buffer.hh>

namespace tus {

// Free list of I/O buffers, private to one store on one shard so that
// buffer contents never travel to unrelated code. Buffers are grouped by
// size; at most `capacity` idle buffers of each size are kept, the rest are
// freed on release.
class buffer_pool {
    size_t _capacity;
    std::unordered_map<size_t, std::vector<seastar::temporary_buffer<char>>> _idle;

    void release(seastar::temporary_buffer<char> buf) noexcept;

public:
    // Owns a buffer while in use and gives it back to the pool when destroyed.
    class handle {
        buffer_pool* _pool = nullptr;
        seastar::temporary_buffer<char> _buf;

    public:
        handle() = default;
        handle(buffer_pool& pool, seastar::temporary_buffer<char> buf) noexcept
            : _pool(&pool)
            , _buf(std::move(buf))
        {}
        handle(handle&& o) noexcept
            : _pool(std::exchange(o._pool, nullptr))
            , _buf(std::move(o._buf))
        {}
        handle& operator=(handle&& o) noexcept {
            if (this != &o) {
                reset();
                _pool = std::exchange(o._pool, nullptr);
                _buf = std::move(o._buf);
            }
            return *this;
        }
        handle(const handle&) = delete;
        handle& operator=(const handle&) = delete;
        ~handle() {
            reset();
        }

        void reset() noexcept {
            if (_pool) {
                std::exchange(_pool, nullptr)->release(std::move(_buf));
            }
        }

        char* get_write() noexcept { return _buf.get_write(); }
        const char* get() const noexcept { return _buf.get(); }
        size_t size() const noexcept { return _buf.size(); }
    };

    explicit buffer_pool(size_t capacity) noexcept
        : _capacity(capacity)
    {}

    buffer_pool(const buffer_pool&) = delete;
    buffer_pool& operator=(const buffer_pool&) = delete;

    // Returns a buffer of exactly `size` bytes whose address is a multiple
    // of `alignment` (a power of two). Contents are unspecified.
    handle acquire(size_t size, size_t alignment);

    size_t idle_count(size_t size) const noexcept;
};

} // namespace tus
