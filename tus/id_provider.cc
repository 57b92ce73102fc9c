/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <seastar/core/format.hh>

#include "tus/id_provider.hh"

using namespace seastar;

namespace tus {

random_id_provider::random_id_provider() = default;

future<sstring> random_id_provider::allocate_id(sstring) {
    static_assert(sizeof(std::random_device::result_type) == sizeof(uint32_t));
    std::array<uint32_t, 4> words;
    std::ranges::generate(words, std::ref(_rd));
    return make_ready_future<sstring>(seastar::format("{:08x}{:08x}{:08x}{:08x}", words[0], words[1], words[2], words[3]));
}

bool is_valid_upload_id(std::string_view id) noexcept {
    // '.' would let an id collide with another id's sidecar records, and
    // also rules out "." and ".."
    return !id.empty() && std::ranges::none_of(id, [] (char c) {
        return c == '/' || c == '\0' || c == '.';
    });
}

} // namespace tus
