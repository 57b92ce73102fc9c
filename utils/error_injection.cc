/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/error_injection.hh"

namespace utils {

logging::logger errinj_logger("debug_error_injection");

error_injection& get_local_injector() {
    static thread_local error_injection local;
    return local;
}

} // namespace utils
