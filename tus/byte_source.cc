/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <seastar/core/coroutine.hh>

#include "tus/byte_source.hh"

using namespace seastar;

namespace tus {

future<size_t> input_stream_source::read(char* dst, size_t len) {
    if (len == 0) {
        co_return 0;
    }
    auto buf = co_await _in.read_up_to(len);
    std::copy_n(buf.get(), buf.size(), dst);
    co_return buf.size();
}

} // namespace tus
