/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>
#include <fstream>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>

#include "test/lib/log.hh"
#include "test/lib/tmpdir.hh"
#include "tus/sidecar_store.hh"
#include "utils/exceptions.hh"

using namespace seastar;
using tus::record_kind;

BOOST_AUTO_TEST_SUITE(sidecar_store_test)

SEASTAR_THREAD_TEST_CASE(test_record_paths) {
    tus::sidecar_store store("/var/uploads");
    BOOST_REQUIRE_EQUAL(store.data_path("abc").native(), "/var/uploads/abc");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::chunk_complete).native(), "/var/uploads/abc.chunkcomplete");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::chunk_start).native(), "/var/uploads/abc.chunkstart");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::expiration).native(), "/var/uploads/abc.expiration");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::upload_length).native(), "/var/uploads/abc.uploadlength");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::metadata).native(), "/var/uploads/abc.metadata");
    BOOST_REQUIRE_EQUAL(store.record_path("abc", record_kind::write_end).native(), "/var/uploads/abc.writeend");
}

SEASTAR_THREAD_TEST_CASE(test_missing_record_reads_as_unset) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    BOOST_REQUIRE(!store.read_text("nope", record_kind::metadata).get());
    BOOST_REQUIRE(!store.read_number("nope", record_kind::upload_length).get());
    BOOST_REQUIRE(!store.exists("nope", record_kind::chunk_complete).get());
}

SEASTAR_THREAD_TEST_CASE(test_empty_record_exists) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    store.create_empty("u1", record_kind::expiration).get();

    BOOST_REQUIRE(store.exists("u1", record_kind::expiration).get());
    auto text = store.read_text("u1", record_kind::expiration).get();
    BOOST_REQUIRE(text);
    BOOST_REQUIRE(text->empty());
    BOOST_REQUIRE(!store.read_number("u1", record_kind::expiration).get());
}

SEASTAR_THREAD_TEST_CASE(test_write_replaces_whole_record) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    store.write_text("u1", record_kind::metadata, "filename dGVzdC50eHQ=,filetype dGV4dC9wbGFpbg==").get();
    store.write_text("u1", record_kind::metadata, "short").get();

    BOOST_REQUIRE_EQUAL(*store.read_text("u1", record_kind::metadata).get(), "short");

    // and the file on disk has no leftovers of the longer value
    std::ifstream in(store.record_path("u1", record_kind::metadata));
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    BOOST_REQUIRE_EQUAL(content, "short");
}

SEASTAR_THREAD_TEST_CASE(test_create_empty_truncates) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    store.write_text("u1", record_kind::chunk_start, "1234").get();
    store.create_empty("u1", record_kind::chunk_start).get();
    BOOST_REQUIRE_EQUAL(*store.read_text("u1", record_kind::chunk_start).get(), "");
}

SEASTAR_THREAD_TEST_CASE(test_read_number) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    store.write_text("u1", record_kind::upload_length, "18446744073709551615").get();
    BOOST_REQUIRE_EQUAL(*store.read_number("u1", record_kind::upload_length).get(), std::numeric_limits<uint64_t>::max());

    store.write_text("u1", record_kind::chunk_start, "12ab").get();
    BOOST_REQUIRE_EXCEPTION(store.read_number("u1", record_kind::chunk_start).get(), storage_io_error,
                            [] (const storage_io_error& e) { return e.code().value() == EINVAL; });

    store.write_text("u1", record_kind::chunk_start, "-1").get();
    BOOST_REQUIRE_THROW(store.read_number("u1", record_kind::chunk_start).get(), storage_io_error);
}

SEASTAR_THREAD_TEST_CASE(test_remove) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path());
    store.write_text("u1", record_kind::chunk_complete, "1").get();
    store.remove("u1", record_kind::chunk_complete).get();
    BOOST_REQUIRE(!store.exists("u1", record_kind::chunk_complete).get());

    testlog.debug("removing a missing record again");
    BOOST_REQUIRE_NO_THROW(store.remove("u1", record_kind::chunk_complete).get());
}

SEASTAR_THREAD_TEST_CASE(test_missing_directory_is_storage_error) {
    tmpdir tmp;
    tus::sidecar_store store(tmp.path() / "does-not-exist");
    BOOST_REQUIRE_EXCEPTION(store.write_text("u1", record_kind::metadata, "x").get(), storage_io_error,
                            [] (const storage_io_error& e) { return e.code().value() == ENOENT; });
    BOOST_REQUIRE_EXCEPTION(store.create_empty("u1", record_kind::metadata).get(), storage_io_error,
                            [] (const storage_io_error& e) { return e.code().value() == ENOENT; });
}

BOOST_AUTO_TEST_SUITE_END()
