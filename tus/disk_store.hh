/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/sstring.hh>

#include "tus/buffer_pool.hh"
#include "tus/byte_source.hh"
#include "tus/id_provider.hh"
#include "tus/sidecar_store.hh"
#include "tus/store_config.hh"
#include "tus/timestamp.hh"

namespace tus {

struct store_stats {
    uint64_t uploads_created = 0;
    uint64_t bytes_appended = 0;
    uint64_t chunks_completed = 0;
    uint64_t chunks_interrupted = 0;
    uint64_t overflows = 0;
};

struct chunk_state {
    // Data size when the last append attempt started, unset before the first one.
    std::optional<uint64_t> chunk_start;
    // No append attempt is in flight or was cut short. True for a fresh
    // upload, whose chunk-complete record is created empty.
    bool complete = false;
};

// Resumable uploads kept as plain files in one directory: the data file
// named by the upload id, plus the sidecar records of sidecar_store.
//
// A store instance belongs to the shard that created it. It does not
// serialize appends to the same upload; the caller must.
class disk_store {
    store_config_ptr _cfg;
    sidecar_store _sidecars;
    std::unique_ptr<id_provider> _ids;
    buffer_pool _buffers;
    store_stats _stats;
    seastar::metrics::metric_groups _metrics;

    seastar::future<> create_data_file(seastar::sstring upload_id);

public:
    // Without an id provider, ids are random.
    explicit disk_store(store_config_ptr cfg, std::unique_ptr<id_provider> ids = nullptr);

    const store_config& config() const noexcept { return *_cfg; }
    const sidecar_store& sidecars() const noexcept { return _sidecars; }
    const store_stats& stats() const noexcept { return _stats; }

    void register_metrics();

    // Creates an empty upload. An unset length means the client will tell
    // it later, see set_upload_length().
    seastar::future<seastar::sstring> create_upload(std::optional<uint64_t> upload_length, seastar::sstring metadata);

    // Appends the body of one request to the upload. Stops early, without
    // error, when `as` fires; the bytes read so far are kept but the chunk
    // is not marked complete.
    seastar::future<uint64_t> append_chunk(seastar::sstring upload_id, byte_source& source, seastar::abort_source* as = nullptr);
    seastar::future<uint64_t> append_chunk(seastar::sstring upload_id, seastar::input_stream<char>& in, seastar::abort_source* as = nullptr);

    // Overwrites the expiration. Does not check that the upload exists.
    seastar::future<> set_expiration(seastar::sstring upload_id, expiration_clock::time_point expires);

    // Only valid while the length is unset, and not below the data already received.
    seastar::future<> set_upload_length(seastar::sstring upload_id, uint64_t upload_length);

    seastar::future<bool> upload_exists(seastar::sstring upload_id) const;
    seastar::future<uint64_t> get_upload_offset(seastar::sstring upload_id) const;
    seastar::future<std::optional<uint64_t>> get_upload_length(seastar::sstring upload_id) const;
    seastar::future<std::optional<seastar::sstring>> get_upload_metadata(seastar::sstring upload_id) const;
    seastar::future<std::optional<expiration_clock::time_point>> get_expiration(seastar::sstring upload_id) const;
    seastar::future<chunk_state> get_chunk_state(seastar::sstring upload_id) const;
};

} // namespace tus
