/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <random>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

namespace tus {

class id_provider {
public:
    virtual ~id_provider() = default;

    // Returns an id that is unique in the upload directory and usable as a
    // file name. The metadata is what the client sent with the creation
    // request and may be ignored.
    virtual seastar::future<seastar::sstring> allocate_id(seastar::sstring metadata) = 0;
};

// 128 random bits as 32 lowercase hex digits. Every id is drawn from the
// system entropy source, so ids do not reveal each other.
class random_id_provider final : public id_provider {
    std::random_device _rd;

public:
    random_id_provider();

    virtual seastar::future<seastar::sstring> allocate_id(seastar::sstring metadata) override;
};

// Whether `id` can name a data file inside the upload directory without
// escaping it or clashing with the sidecar naming scheme.
bool is_valid_upload_id(std::string_view id) noexcept;

} // namespace tus
