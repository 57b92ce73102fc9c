/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "utils/log.hh"

namespace utils {

extern logging::logger errinj_logger;

// Named failure points, enabled by tests. Code under test calls
// inject(name, func) where a failure can be simulated; func runs, and
// usually throws, only while that name is enabled. A one-shot injection
// fires once and then stays silent until enabled again.
//
// One injector per shard, see get_local_injector().
class error_injection {
    struct injection_data {
        bool one_shot;
        unsigned hits = 0;
    };
    std::map<std::string, injection_data, std::less<>> _enabled;

public:
    void enable(std::string_view name, bool one_shot = false) {
        _enabled.insert_or_assign(std::string(name), injection_data{one_shot});
        errinj_logger.debug("Enabling injection {} one_shot={}", name, one_shot);
    }

    void disable(std::string_view name) {
        if (auto it = _enabled.find(name); it != _enabled.end()) {
            _enabled.erase(it);
        }
    }

    void disable_all() {
        _enabled.clear();
    }

    bool is_enabled(std::string_view name) const {
        auto it = _enabled.find(name);
        return it != _enabled.end() && !(it->second.one_shot && it->second.hits > 0);
    }

    // Times the injection fired since it was enabled.
    unsigned hits(std::string_view name) const {
        auto it = _enabled.find(name);
        return it == _enabled.end() ? 0 : it->second.hits;
    }

    template <typename Func>
    void inject(std::string_view name, Func&& f) {
        if (_enabled.empty()) {
            return;
        }
        auto it = _enabled.find(name);
        if (it == _enabled.end() || (it->second.one_shot && it->second.hits > 0)) {
            return;
        }
        ++it->second.hits;
        errinj_logger.debug("Triggering injection {}", name);
        std::invoke(std::forward<Func>(f));
    }
};

error_injection& get_local_injector();

} // namespace utils
