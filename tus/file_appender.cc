/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fmt/format.h>
#include <seastar/core/align.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "tus/file_appender.hh"
#include "utils/error_injection.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"

using namespace seastar;

namespace tus {

static logging::logger alog("tus_appender");

file_appender::file_appender(std::filesystem::path path, file f, uint64_t size, size_t alignment) noexcept
    : _path(std::move(path))
    , _file(std::move(f))
    , _size(size)
    , _alignment(alignment)
{}

future<file_appender> file_appender::open(std::filesystem::path path) {
    file f;
    try {
        f = co_await open_file_dma(path.native(), open_flags::rw);
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot open {}", path.native()));
    }

    std::exception_ptr ex;
    uint64_t size = 0;
    try {
        size = co_await f.size();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await f.close();
        co_await coroutine::return_exception(map_storage_exception(std::move(ex), fmt::format("Cannot stat {}", path.native())));
    }

    size_t alignment = std::max({uint64_t(f.disk_write_dma_alignment()), uint64_t(f.disk_read_dma_alignment()), uint64_t(f.memory_dma_alignment())});
    alog.trace("Opened {}: size={} alignment={}", path.native(), size, alignment);
    co_return file_appender(std::move(path), std::move(f), size, alignment);
}

size_t file_appender::buffer_size_for(size_t capacity, size_t max_block) const noexcept {
    return align_up(std::max(capacity, max_block) + _alignment, _alignment);
}

future<> file_appender::truncate(uint64_t size) {
    if (_buffer.size() != 0) {
        on_internal_error(alog, fmt::format("truncate of {} with a write buffer attached", _path.native()));
    }
    try {
        co_await _file.truncate(size);
        co_await _file.flush();
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot truncate {}", _path.native()));
    }
    _size = size;
}

future<> file_appender::attach_buffer(buffer_pool::handle buf, size_t capacity) {
    _buffer = std::move(buf);
    _capacity = capacity;
    _base = align_down(_size, uint64_t(_alignment));
    _head = _size - _base;
    _pending = 0;
    if (_head == 0) {
        co_return;
    }

    size_t got = 0;
    try {
        got = co_await _file.dma_read(_base, _buffer.get_write(), _alignment);
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot read tail of {}", _path.native()));
    }
    if (got < _head) {
        throw storage_io_error(EIO, fmt::format("Short read of tail of {}: {} of {} bytes at {}", _path.native(), got, _head, _base));
    }
}

void file_appender::put(const char* data, size_t len) {
    if (_head + _pending + len > _buffer.size()) {
        on_internal_error(alog, fmt::format("write buffer of {} overflows: head={} pending={} len={} size={}",
                _path.native(), _head, _pending, len, _buffer.size()));
    }
    std::copy_n(data, len, _buffer.get_write() + _head + _pending);
    _pending += len;
}

future<> file_appender::flush() {
    if (_pending == 0) {
        co_return;
    }

    auto len = _head + _pending;
    auto padded = align_up(len, _alignment);
    auto* data = _buffer.get_write();
    std::fill(data + len, data + padded, 0);
    auto end = _base + len;

    alog.trace("Flush {} bytes to {} at {}", _pending, _path.native(), _size);
    try {
        utils::get_local_injector().inject("file_appender_write", [] {
            throw std::system_error(EIO, std::system_category(), "injected write failure");
        });
        auto written = co_await _file.dma_write(_base, data, padded);
        if (written != padded) {
            throw storage_io_error(EIO, fmt::format("Short write to {}: {} of {} bytes at {}", _path.native(), written, padded, _base));
        }
        if (padded != len) {
            utils::get_local_injector().inject("file_appender_truncate", [] {
                throw std::system_error(EIO, std::system_category(), "injected truncate failure");
            });
            co_await _file.truncate(end);
        }
        co_await _file.flush();
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot write {}", _path.native()));
    }

    _size = end;
    auto next_base = align_down(end, uint64_t(_alignment));
    auto tail = size_t(end - next_base);
    if (tail != 0) {
        std::memmove(data, data + (next_base - _base), tail);
    }
    _base = next_base;
    _head = tail;
    _pending = 0;
}

future<> file_appender::close() {
    _buffer.reset();
    try {
        co_await _file.close();
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot close {}", _path.native()));
    }
}

} // namespace tus
