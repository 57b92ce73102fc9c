/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>
#include <charconv>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "tus/sidecar_store.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"

using namespace seastar;

namespace tus {

static logging::logger slog("tus_sidecar");

std::string_view record_suffix(record_kind kind) noexcept {
    switch (kind) {
    case record_kind::chunk_complete:
        return "chunkcomplete";
    case record_kind::chunk_start:
        return "chunkstart";
    case record_kind::expiration:
        return "expiration";
    case record_kind::upload_length:
        return "uploadlength";
    case record_kind::metadata:
        return "metadata";
    case record_kind::write_end:
        return "writeend";
    }
    return "unknown";
}

sidecar_store::sidecar_store(std::filesystem::path directory)
    : _directory(std::move(directory))
{}

std::filesystem::path sidecar_store::data_path(std::string_view upload_id) const {
    return _directory / upload_id;
}

std::filesystem::path sidecar_store::record_path(std::string_view upload_id, record_kind kind) const {
    return _directory / fmt::format("{}.{}", upload_id, kind);
}

future<> sidecar_store::create_empty(sstring upload_id, record_kind kind) const {
    auto path = record_path(upload_id, kind);
    slog.trace("Create empty {}", path.native());
    try {
        auto f = co_await open_file_dma(path.native(), open_flags::wo | open_flags::create | open_flags::truncate);
        co_await f.close();
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot create {}", path.native()));
    }
}

future<> sidecar_store::write_text(sstring upload_id, record_kind kind, sstring value) const {
    auto path = record_path(upload_id, kind);
    slog.trace("Write {} bytes to {}", value.size(), path.native());

    file f;
    try {
        f = co_await open_file_dma(path.native(), open_flags::wo | open_flags::create | open_flags::truncate);
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot open {}", path.native()));
    }

    // The stream owns the file from here on and closes it.
    output_stream<char> out;
    try {
        out = co_await make_file_output_stream(std::move(f));
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot open {}", path.native()));
    }
    std::exception_ptr ex;
    try {
        co_await out.write(value.data(), value.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    try {
        co_await out.close();
    } catch (...) {
        if (!ex) {
            ex = std::current_exception();
        }
    }
    if (ex) {
        co_await coroutine::return_exception(map_storage_exception(std::move(ex), fmt::format("Cannot write {}", path.native())));
    }
}

future<std::optional<sstring>> sidecar_store::read_text(sstring upload_id, record_kind kind) const {
    auto path = record_path(upload_id, kind);

    std::exception_ptr ex;
    file f;
    try {
        f = co_await open_file_dma(path.native(), open_flags::ro);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (is_enoent(ex)) {
            slog.trace("Read {}: missing", path.native());
            co_return std::nullopt;
        }
        co_await coroutine::return_exception(map_storage_exception(std::move(ex), fmt::format("Cannot open {}", path.native())));
    }

    auto in = make_file_input_stream(std::move(f));
    sstring text;
    try {
        text = co_await util::read_entire_stream_contiguous(in);
    } catch (...) {
        ex = std::current_exception();
    }
    try {
        co_await in.close();
    } catch (...) {
        if (!ex) {
            ex = std::current_exception();
        }
    }
    if (ex) {
        co_await coroutine::return_exception(map_storage_exception(std::move(ex), fmt::format("Cannot read {}", path.native())));
    }
    slog.trace("Read {} bytes from {}", text.size(), path.native());
    co_return text;
}

future<std::optional<uint64_t>> sidecar_store::read_number(sstring upload_id, record_kind kind) const {
    auto text = co_await read_text(upload_id, kind);
    if (!text || text->empty()) {
        co_return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc() || ptr != text->data() + text->size()) {
        throw storage_io_error(EINVAL, fmt::format("Malformed {} record of {}: '{}'", kind, upload_id, *text));
    }
    co_return value;
}

future<> sidecar_store::remove(sstring upload_id, record_kind kind) const {
    auto path = record_path(upload_id, kind);
    std::exception_ptr ex;
    try {
        co_await remove_file(path.native());
        slog.trace("Removed {}", path.native());
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex && !is_enoent(ex)) {
        co_await coroutine::return_exception(map_storage_exception(std::move(ex), fmt::format("Cannot remove {}", path.native())));
    }
}

future<bool> sidecar_store::exists(sstring upload_id, record_kind kind) const {
    auto path = record_path(upload_id, kind);
    try {
        co_return co_await file_exists(path.native());
    } catch (...) {
        throw map_storage_exception(std::current_exception(), fmt::format("Cannot stat {}", path.native()));
    }
}

} // namespace tus
