/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>

namespace tus {

// Body of one upload request, consumed front to back, once.
class byte_source {
public:
    virtual ~byte_source() = default;

    // Copies up to `len` bytes into `dst`. Resolves to 0 at the end of the
    // stream and to at least 1 otherwise. A source that observes a client
    // disconnect may fail with seastar::abort_requested_exception.
    virtual seastar::future<size_t> read(char* dst, size_t len) = 0;
};

// Adapts a seastar input stream, e.g. the body of an httpd request. The
// stream is borrowed and is not closed.
class input_stream_source final : public byte_source {
    seastar::input_stream<char>& _in;

public:
    explicit input_stream_source(seastar::input_stream<char>& in) noexcept
        : _in(in)
    {}

    virtual seastar::future<size_t> read(char* dst, size_t len) override;
};

} // namespace tus
