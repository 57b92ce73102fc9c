/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "tus/chunk_appender.hh"
#include "tus/exceptions.hh"
#include "tus/file_appender.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"

using namespace seastar;

namespace tus {

static logging::logger applog("tus_append");

chunk_appender::chunk_appender(const store_config& cfg,
                               const sidecar_store& sidecars,
                               buffer_pool& buffers,
                               sstring upload_id,
                               byte_source& source,
                               seastar::abort_source* as) noexcept
    : _cfg(cfg)
    , _sidecars(sidecars)
    , _buffers(buffers)
    , _upload_id(std::move(upload_id))
    , _source(source)
    , _as(as)
{}

future<size_t> chunk_appender::read_block(char* dst, size_t len) {
    std::exception_ptr ex;
    try {
        co_return co_await _source.read(dst, len);
    } catch (const abort_requested_exception&) {
        applog.debug("Reading data of {} aborted", _upload_id);
        _disconnected = true;
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await coroutine::return_exception(source_read_error(std::move(ex)));
    }
    co_return 0;
}

future<> chunk_appender::flush(file_appender& out) {
    if (out.pending() == 0) {
        co_return;
    }
    co_await _sidecars.write_text(_upload_id, record_kind::write_end, to_sstring(out.size()));
    co_await out.flush();
}

future<> chunk_appender::drop_padding(file_appender& out) {
    auto end = co_await _sidecars.read_number(_upload_id, record_kind::write_end);
    if (end && out.size() > *end) {
        applog.warn("Data file of {} has {} bytes past the last write, flush was interrupted; truncating to {}",
                _upload_id, out.size() - *end, *end);
        co_await out.truncate(*end);
    }
}

future<uint64_t> chunk_appender::copy(file_appender& out, std::optional<uint64_t> upload_length) {
    uint64_t position = out.size();
    if (upload_length && position == *upload_length) {
        applog.debug("Upload {} is already complete ({} bytes)", _upload_id, position);
        co_return 0;
    }

    auto read_buf = _buffers.acquire(_cfg.read_buffer_size, out.alignment());
    auto write_buf = _buffers.acquire(out.buffer_size_for(_cfg.write_buffer_size, _cfg.read_buffer_size), out.alignment());
    co_await out.attach_buffer(std::move(write_buf), _cfg.write_buffer_size);

    co_await _sidecars.remove(_upload_id, record_kind::chunk_complete);
    co_await _sidecars.write_text(_upload_id, record_kind::chunk_start, to_sstring(position));
    applog.debug("Appending to {} at {}", _upload_id, position);

    uint64_t appended = 0;
    std::exception_ptr ex;
    bool storage_failed = false;
    try {
        size_t n = 0;
        do {
            if (abort_requested()) {
                _disconnected = true;
                break;
            }
            n = co_await read_block(read_buf.get_write(), read_buf.size());
            _disconnected = _disconnected || abort_requested();

            position += n;
            if (upload_length && position > *upload_length) {
                throw upload_overflow_error(position, *upload_length);
            }

            if (!out.fits(n)) {
                co_await flush(out);
            }
            out.put(read_buf.get(), n);
            appended += n;
        } while (n != 0 && !_disconnected);

        co_await flush(out);
    } catch (const storage_io_error&) {
        ex = std::current_exception();
        storage_failed = true;
    } catch (...) {
        ex = std::current_exception();
    }

    if (ex && storage_failed) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    if (ex) {
        // Bytes buffered before the failure are valid upload data
        try {
            co_await flush(out);
        } catch (...) {
            applog.warn("Cannot flush buffered data of {} after failed append: {}", _upload_id, std::current_exception());
        }
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    if (!_disconnected) {
        co_await _sidecars.write_text(_upload_id, record_kind::chunk_complete, "1");
    }
    applog.debug("Appended {} bytes to {}, now at {}{}", appended, _upload_id, position, _disconnected ? " (client disconnected)" : "");
    co_return appended;
}

future<uint64_t> chunk_appender::append() {
    auto upload_length = co_await _sidecars.read_number(_upload_id, record_kind::upload_length);
    if (!upload_length) {
        applog.debug("Upload length of {} is not known yet, appending without overflow check", _upload_id);
    }

    auto out = co_await file_appender::open(_sidecars.data_path(_upload_id));

    std::exception_ptr ex;
    uint64_t appended = 0;
    try {
        co_await drop_padding(out);
        appended = co_await copy(out, upload_length);
    } catch (...) {
        ex = std::current_exception();
    }
    try {
        co_await out.close();
    } catch (...) {
        if (ex) {
            applog.warn("Cannot close data file of {}: {}", _upload_id, std::current_exception());
        } else {
            ex = std::current_exception();
        }
    }
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_return appended;
}

} // namespace tus
