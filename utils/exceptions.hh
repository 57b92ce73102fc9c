/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

// Failure of a filesystem operation (open, read, write, flush, truncate, remove).
// The error code is the errno reported by the kernel, or EIO / EINVAL when the
// failure is detected by us (short writes, corrupted records).
class storage_io_error : public std::exception {
private:
    std::error_code _code;
    std::string _what;
public:
    storage_io_error(std::error_code c, std::string s) noexcept
        : _code(std::move(c))
        , _what(std::move(s))
    {}

    storage_io_error(int err, std::string s) noexcept
        : storage_io_error(std::error_code(err, std::system_category()), std::move(s))
    {}

    explicit storage_io_error(const std::system_error& e) noexcept
        : storage_io_error(e.code(), std::string("Storage I/O error: ") + std::to_string(e.code().value()) + ": " + e.what())
    {}

    virtual const char* what() const noexcept override {
        return _what.c_str();
    }

    const std::error_code& code() const noexcept {
        return _code;
    }
};

// Converts whatever a seastar file operation failed with into storage_io_error.
// `context` names the operation and is prepended to the message.
storage_io_error map_storage_exception(std::exception_ptr ex, std::string_view context);

bool is_enoent(const std::exception_ptr& ex) noexcept;
