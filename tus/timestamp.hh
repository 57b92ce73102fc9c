/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <string_view>
#include <seastar/core/sstring.hh>

namespace tus {

using expiration_clock = std::chrono::system_clock;

// Formats as UTC "YYYY-MM-DDTHH:MM:SS.ffffff+00:00". Fixed width, so the text
// sorts in time order. Sub-microsecond precision is dropped.
seastar::sstring format_timestamp(expiration_clock::time_point tp);

// Accepts the format above, and more generally ISO 8601 date-time with an
// optional fraction of up to 9 digits and a "Z" or "+HH:MM" / "-HH:MM" zone.
// Throws std::invalid_argument on anything else.
expiration_clock::time_point parse_timestamp(std::string_view text);

} // namespace tus
