/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>

#include "tus/exceptions.hh"
#include "utils/log.hh"

namespace tus {

id_allocation_error::id_allocation_error(std::exception_ptr cause)
    : std::runtime_error(fmt::format("Failed to allocate upload id: {}", cause))
{}

upload_overflow_error::upload_overflow_error(uint64_t position, uint64_t upload_length)
    : std::runtime_error(fmt::format("Stream contains more data than the file's upload length. Stream data: {}, upload length: {}", position, upload_length))
    , _position(position)
    , _upload_length(upload_length)
{}

source_read_error::source_read_error(std::exception_ptr cause)
    : std::runtime_error(fmt::format("Failed to read upload data: {}", cause))
{}

} // namespace tus
