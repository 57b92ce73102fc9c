/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>
#include <fmt/format.h>
#include <seastar/core/memory.hh>

#include "utils/exceptions.hh"
#include "utils/log.hh"

storage_io_error map_storage_exception(std::exception_ptr ex, std::string_view context) {
    seastar::memory::scoped_critical_alloc_section alloc;

    try {
        std::rethrow_exception(std::move(ex));
    } catch (const storage_io_error& e) {
        return e;
    } catch (const std::system_error& e) {
        return {e.code(), fmt::format("{}: {}", context, e.what())};
    } catch (const std::bad_alloc&) {
        return {ENOMEM, fmt::format("{}: out of memory", context)};
    } catch (...) {
        return {EIO, fmt::format("{}: {}", context, std::current_exception())};
    }
}

bool is_enoent(const std::exception_ptr& ex) noexcept {
    try {
        std::rethrow_exception(ex);
    } catch (const std::system_error& e) {
        return e.code().value() == ENOENT;
    } catch (const storage_io_error& e) {
        return e.code().value() == ENOENT;
    } catch (...) {
        return false;
    }
}
