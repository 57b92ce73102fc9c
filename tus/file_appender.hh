/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <seastar/core/file.hh>
#include <seastar/core/future.hh>

#include "tus/buffer_pool.hh"

namespace tus {

// Appends to the end of an existing file through a write buffer.
//
// The file is opened for DMA, so every write has to start and end on an
// alignment boundary. The write buffer therefore mirrors the file starting
// at the last aligned offset below its end: the first `_head` bytes are the
// tail of the last partial block, already on disk, followed by `_pending`
// new bytes. A flush writes the whole padded range, truncates the padding
// away and syncs, then moves the new partial tail to the front. Until the
// truncate completes the file is longer than its data; callers that must
// survive an interrupted flush record size() beforehand and pass it to
// truncate() after reopening.
class file_appender {
    std::filesystem::path _path;
    seastar::file _file;
    uint64_t _size;
    size_t _alignment;
    buffer_pool::handle _buffer;
    size_t _capacity = 0;
    uint64_t _base = 0;
    size_t _head = 0;
    size_t _pending = 0;

    file_appender(std::filesystem::path path, seastar::file f, uint64_t size, size_t alignment) noexcept;

public:
    // Opens an existing file. ENOENT if there is none.
    static seastar::future<file_appender> open(std::filesystem::path path);

    file_appender(file_appender&&) noexcept = default;

    // Bytes on disk plus bytes waiting in the buffer.
    uint64_t size() const noexcept { return _size + _pending; }
    size_t alignment() const noexcept { return _alignment; }
    size_t pending() const noexcept { return _pending; }

    // Cuts the file down to `size` bytes. Only valid before attach_buffer().
    seastar::future<> truncate(uint64_t size);

    // Size of the buffer `attach_buffer` needs to hold `capacity` pending
    // bytes, or a single block of `max_block` bytes, next to a partial tail.
    size_t buffer_size_for(size_t capacity, size_t max_block) const noexcept;

    // Takes the write buffer and loads the partial tail block into it.
    // Must be called once before put().
    seastar::future<> attach_buffer(buffer_pool::handle buf, size_t capacity);

    // Whether `len` more bytes can be buffered without a flush first.
    bool fits(size_t len) const noexcept { return _pending + len <= _capacity; }

    void put(const char* data, size_t len);

    // Writes and syncs the buffered bytes. No-op with nothing buffered.
    seastar::future<> flush();

    // Does not flush.
    seastar::future<> close();
};

} // namespace tus
