/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace tus {

// The id provider failed, or produced an id that cannot name a file.
class id_allocation_error : public std::runtime_error {
public:
    explicit id_allocation_error(std::string msg)
        : std::runtime_error(std::move(msg))
    {}
    explicit id_allocation_error(std::exception_ptr cause);
};

// The client sent more data than it declared when creating the upload.
class upload_overflow_error : public std::runtime_error {
    uint64_t _position;
    uint64_t _upload_length;
public:
    upload_overflow_error(uint64_t position, uint64_t upload_length);

    uint64_t position() const noexcept { return _position; }
    uint64_t upload_length() const noexcept { return _upload_length; }
};

// Reading the request body failed.
class source_read_error : public std::runtime_error {
public:
    explicit source_read_error(std::exception_ptr cause);
};

class upload_length_error : public std::invalid_argument {
public:
    explicit upload_length_error(std::string msg)
        : std::invalid_argument(std::move(msg))
    {}
};

} // namespace tus
