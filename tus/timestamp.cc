/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cctype>
#include <ctime>
#include <stdexcept>
#include <string>
#include <fmt/chrono.h>
#include <seastar/core/format.hh>

#include "tus/timestamp.hh"

namespace tus {

seastar::sstring format_timestamp(expiration_clock::time_point tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    std::time_t t = expiration_clock::to_time_t(secs);
    std::tm tm = {};
    if (::gmtime_r(&t, &tm) == nullptr) {
        throw std::invalid_argument(seastar::format("Cannot represent time {} as UTC calendar time", t));
    }
    return seastar::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}+00:00", tm, micros);
}

static int parse_two_digits(const char*& p, std::string_view text) {
    if (!std::isdigit(static_cast<unsigned char>(p[0])) || !std::isdigit(static_cast<unsigned char>(p[1]))) {
        throw std::invalid_argument(seastar::format("Malformed zone offset in timestamp {}", text));
    }
    int v = (p[0] - '0') * 10 + (p[1] - '0');
    p += 2;
    return v;
}

expiration_clock::time_point parse_timestamp(std::string_view text) {
    std::string in(text);
    std::tm tm = {};

    const char* p = ::strptime(in.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (p == nullptr) {
        throw std::invalid_argument(seastar::format("Failed to parse ISO 8601 timestamp {}", text));
    }

    std::chrono::nanoseconds fraction{0};
    if (*p == '.') {
        ++p;
        int digits = 0;
        int64_t ns = 0;
        for (; std::isdigit(static_cast<unsigned char>(*p)); ++p, ++digits) {
            // digits past nanoseconds are truncated
            if (digits < 9) {
                ns = ns * 10 + (*p - '0');
            }
        }
        if (digits == 0) {
            throw std::invalid_argument(seastar::format("Empty fraction of second in timestamp {}", text));
        }
        for (; digits < 9; ++digits) {
            ns *= 10;
        }
        fraction = std::chrono::nanoseconds(ns);
    }

    std::chrono::minutes offset{0};
    if (*p == 'Z') {
        ++p;
    } else if (*p == '+' || *p == '-') {
        int sign = *p == '-' ? -1 : 1;
        ++p;
        auto hours = parse_two_digits(p, text);
        if (*p != ':') {
            throw std::invalid_argument(seastar::format("Malformed zone offset in timestamp {}", text));
        }
        ++p;
        auto minutes = parse_two_digits(p, text);
        offset = std::chrono::minutes(sign * (hours * 60 + minutes));
    } else {
        throw std::invalid_argument(seastar::format("Timestamp {} has no time zone", text));
    }
    if (*p != '\0') {
        throw std::invalid_argument(seastar::format("Trailing characters in timestamp {}", text));
    }

    auto local = expiration_clock::from_time_t(::timegm(&tm));
    return local - offset + std::chrono::duration_cast<expiration_clock::duration>(fraction);
}

} // namespace tus
