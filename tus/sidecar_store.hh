/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <fmt/format.h>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

namespace tus {

// Per-upload records kept next to the data file, one file each,
// named "{upload id}.{suffix}".
enum class record_kind {
    chunk_complete,
    chunk_start,
    expiration,
    upload_length,
    metadata,
    // Data size the last flush was about to reach. Only the append path
    // writes it; bytes past it are padding of an interrupted flush.
    write_end,
};

std::string_view record_suffix(record_kind kind) noexcept;

// Small key-value store over the upload directory. The key is the pair
// (upload id, record kind), the value is the whole content of the record
// file. A missing record is a valid "unset" state. Every call goes to disk,
// nothing is cached, and nothing serializes concurrent calls for one id.
class sidecar_store {
    std::filesystem::path _directory;

public:
    explicit sidecar_store(std::filesystem::path directory);

    std::filesystem::path data_path(std::string_view upload_id) const;
    std::filesystem::path record_path(std::string_view upload_id, record_kind kind) const;

    // Creates the record, or truncates an existing one, to zero length.
    seastar::future<> create_empty(seastar::sstring upload_id, record_kind kind) const;

    // Replaces the whole content of the record.
    seastar::future<> write_text(seastar::sstring upload_id, record_kind kind, seastar::sstring value) const;

    seastar::future<std::optional<seastar::sstring>> read_text(seastar::sstring upload_id, record_kind kind) const;

    // Decimal unsigned record. Missing and empty records both read as unset,
    // anything else that is not a number is reported as EINVAL.
    seastar::future<std::optional<uint64_t>> read_number(seastar::sstring upload_id, record_kind kind) const;

    // Missing records are not an error.
    seastar::future<> remove(seastar::sstring upload_id, record_kind kind) const;

    seastar::future<bool> exists(seastar::sstring upload_id, record_kind kind) const;
};

} // namespace tus

template <>
struct fmt::formatter<tus::record_kind> : fmt::formatter<std::string_view> {
    auto format(tus::record_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(tus::record_suffix(kind), ctx);
    }
};
