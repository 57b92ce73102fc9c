/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <seastar/core/shared_ptr.hh>

namespace tus {

struct store_config {
    // Holds the data files and their sidecar records.
    std::filesystem::path directory;
    // Upper bound of a single read from the request body.
    size_t read_buffer_size = 51200;
    // Bytes accumulated before they are written and flushed to disk.
    size_t write_buffer_size = 51200;
    // Idle buffers of each size the store keeps for reuse.
    size_t buffer_pool_capacity = 16;
};

using store_config_ptr = seastar::lw_shared_ptr<const store_config>;

} // namespace tus
