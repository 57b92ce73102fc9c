/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "tus/buffer_pool.hh"
#include "tus/byte_source.hh"
#include "tus/sidecar_store.hh"
#include "tus/store_config.hh"

namespace tus {

class file_appender;

// Copies one request body to the end of an upload's data file.
//
// Reads go through a read buffer of read_buffer_size bytes and are collected
// in a separate write buffer, which is written and synced only when the next
// read would not fit, and once more at the end. This keeps the number of
// syncs low when the client sends many small packets.
//
// The chunk-start record receives the data size at the beginning of the
// attempt and the chunk-complete record is removed; the latter is written
// back only if the source was consumed to the end without the abort source
// firing. Whatever reached the write buffer is flushed when the source fails
// or overflows; a storage error is passed on without touching the file again.
//
// Before each flush the write-end record receives the data size the flush
// will reach. The next append truncates the file back to it, so padding left
// by an interrupted flush never becomes upload data.
class chunk_appender {
    const store_config& _cfg;
    const sidecar_store& _sidecars;
    buffer_pool& _buffers;
    seastar::sstring _upload_id;
    byte_source& _source;
    seastar::abort_source* _as;
    bool _disconnected = false;

    bool abort_requested() const noexcept {
        return _as && _as->abort_requested();
    }

    seastar::future<size_t> read_block(char* dst, size_t len);

    // Records the end the flush is about to reach, then flushes.
    seastar::future<> flush(file_appender& out);

    // Cuts off zero padding left by a flush that did not finish.
    seastar::future<> drop_padding(file_appender& out);

    seastar::future<uint64_t> copy(file_appender& out, std::optional<uint64_t> upload_length);

public:
    chunk_appender(const store_config& cfg,
                   const sidecar_store& sidecars,
                   buffer_pool& buffers,
                   seastar::sstring upload_id,
                   byte_source& source,
                   seastar::abort_source* as) noexcept;

    // Resolves to the number of bytes appended by this call, which is 0 if
    // the upload was already complete.
    seastar::future<uint64_t> append();

    // Whether the copy stopped because of an abort request.
    bool disconnected() const noexcept { return _disconnected; }
};

} // namespace tus
