/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/metrics.hh>
#include <seastar/core/seastar.hh>

#include "tus/chunk_appender.hh"
#include "tus/disk_store.hh"
#include "tus/exceptions.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"

using namespace seastar;

namespace tus {

static logging::logger tlog("tus_store");

disk_store::disk_store(store_config_ptr cfg, std::unique_ptr<id_provider> ids)
    : _cfg(std::move(cfg))
    , _sidecars(_cfg->directory)
    , _ids(std::move(ids))
    , _buffers(_cfg->buffer_pool_capacity)
{
    if (!_ids) {
        _ids = std::make_unique<random_id_provider>();
    }
    if (_cfg->read_buffer_size == 0 || _cfg->write_buffer_size == 0) {
        throw std::invalid_argument(fmt::format("Buffer sizes must be positive, got read={} write={}",
                _cfg->read_buffer_size, _cfg->write_buffer_size));
    }
}

void disk_store::register_metrics() {
    namespace sm = seastar::metrics;
    auto dir_label = sm::label("directory")(_cfg->directory.native());
    _metrics.add_group("tus", {
        sm::make_counter("uploads_created", [this] { return _stats.uploads_created; },
                sm::description("Total number of uploads created"), {dir_label}),
        sm::make_counter("bytes_appended", [this] { return _stats.bytes_appended; },
                sm::description("Total number of bytes appended to data files"), {dir_label}),
        sm::make_counter("chunks_completed", [this] { return _stats.chunks_completed; },
                sm::description("Total number of append requests that consumed their whole body"), {dir_label}),
        sm::make_counter("chunks_interrupted", [this] { return _stats.chunks_interrupted; },
                sm::description("Total number of append requests stopped by a client disconnect"), {dir_label}),
        sm::make_counter("overflows", [this] { return _stats.overflows; },
                sm::description("Total number of append requests rejected for exceeding the upload length"), {dir_label}),
    });
}

future<> disk_store::create_data_file(sstring upload_id) {
    auto path = _sidecars.data_path(upload_id);
    try {
        auto f = co_await open_file_dma(path.native(), open_flags::wo | open_flags::create);
        co_await f.close();
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot create {}", path.native()));
    }
}

future<sstring> disk_store::create_upload(std::optional<uint64_t> upload_length, sstring metadata) {
    sstring upload_id;
    try {
        upload_id = co_await _ids->allocate_id(metadata);
    } catch (const id_allocation_error&) {
        throw;
    } catch (...) {
        throw id_allocation_error(std::current_exception());
    }
    if (!is_valid_upload_id(upload_id)) {
        throw id_allocation_error(fmt::format("Id provider returned an invalid upload id '{}'", upload_id));
    }

    tlog.debug("Create upload {} length={} metadata={} bytes", upload_id,
            upload_length ? fmt::to_string(*upload_length) : "deferred", metadata.size());

    co_await create_data_file(upload_id);
    co_await _sidecars.create_empty(upload_id, record_kind::chunk_complete);
    co_await _sidecars.create_empty(upload_id, record_kind::chunk_start);
    co_await _sidecars.create_empty(upload_id, record_kind::expiration);
    if (upload_length) {
        co_await _sidecars.write_text(upload_id, record_kind::upload_length, to_sstring(*upload_length));
    } else {
        co_await _sidecars.create_empty(upload_id, record_kind::upload_length);
    }
    co_await _sidecars.write_text(upload_id, record_kind::metadata, std::move(metadata));

    ++_stats.uploads_created;
    co_return upload_id;
}

future<uint64_t> disk_store::append_chunk(sstring upload_id, byte_source& source, seastar::abort_source* as) {
    chunk_appender appender(*_cfg, _sidecars, _buffers, upload_id, source, as);
    uint64_t appended = 0;
    try {
        appended = co_await appender.append();
    } catch (const upload_overflow_error& e) {
        ++_stats.overflows;
        tlog.warn("Append to {} rejected: {}", upload_id, e.what());
        throw;
    } catch (...) {
        tlog.error("Append to {} failed: {}", upload_id, std::current_exception());
        throw;
    }

    _stats.bytes_appended += appended;
    if (appender.disconnected()) {
        ++_stats.chunks_interrupted;
        tlog.info("Client disconnected while appending to {}, {} bytes kept", upload_id, appended);
    } else {
        ++_stats.chunks_completed;
    }
    co_return appended;
}

future<uint64_t> disk_store::append_chunk(sstring upload_id, input_stream<char>& in, seastar::abort_source* as) {
    input_stream_source source(in);
    co_return co_await append_chunk(std::move(upload_id), source, as);
}

future<> disk_store::set_expiration(sstring upload_id, expiration_clock::time_point expires) {
    auto text = format_timestamp(expires);
    tlog.debug("Upload {} expires at {}", upload_id, text);
    co_await _sidecars.write_text(std::move(upload_id), record_kind::expiration, std::move(text));
}

future<> disk_store::set_upload_length(sstring upload_id, uint64_t upload_length) {
    auto current = co_await _sidecars.read_number(upload_id, record_kind::upload_length);
    if (current) {
        throw upload_length_error(fmt::format("Upload length of {} is already set to {}", upload_id, *current));
    }
    auto offset = co_await get_upload_offset(upload_id);
    if (upload_length < offset) {
        throw upload_length_error(fmt::format("Upload length {} of {} is below the {} bytes already received", upload_length, upload_id, offset));
    }
    tlog.debug("Set deferred upload length of {} to {}", upload_id, upload_length);
    co_await _sidecars.write_text(std::move(upload_id), record_kind::upload_length, to_sstring(upload_length));
}

future<bool> disk_store::upload_exists(sstring upload_id) const {
    auto path = _sidecars.data_path(upload_id);
    try {
        co_return co_await file_exists(path.native());
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot stat {}", path.native()));
    }
}

future<uint64_t> disk_store::get_upload_offset(sstring upload_id) const {
    auto path = _sidecars.data_path(upload_id);
    uint64_t size = 0;
    try {
        size = co_await file_size(path.native());
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot stat {}", path.native()));
    }
    // padding of an interrupted flush is cut off by the next append
    auto end = co_await _sidecars.read_number(std::move(upload_id), record_kind::write_end);
    co_return end ? std::min(size, *end) : size;
}

future<std::optional<uint64_t>> disk_store::get_upload_length(sstring upload_id) const {
    return _sidecars.read_number(std::move(upload_id), record_kind::upload_length);
}

future<std::optional<sstring>> disk_store::get_upload_metadata(sstring upload_id) const {
    return _sidecars.read_text(std::move(upload_id), record_kind::metadata);
}

future<std::optional<expiration_clock::time_point>> disk_store::get_expiration(sstring upload_id) const {
    auto text = co_await _sidecars.read_text(upload_id, record_kind::expiration);
    if (!text || text->empty()) {
        co_return std::nullopt;
    }
    try {
        co_return parse_timestamp(*text);
    } catch (const std::invalid_argument& e) {
        throw storage_io_error(EINVAL, fmt::format("Malformed expiration record of {}: {}", upload_id, e.what()));
    }
}

future<chunk_state> disk_store::get_chunk_state(sstring upload_id) const {
    chunk_state st;
    st.chunk_start = co_await _sidecars.read_number(upload_id, record_kind::chunk_start);
    st.complete = co_await _sidecars.exists(upload_id, record_kind::chunk_complete);
    co_return st;
}

} // namespace tus
