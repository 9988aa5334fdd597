// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/error.hpp>
#include <haul/disk/error.hpp>
#include <cerrno>

using namespace haul::core;

TEST_CASE("HTTP status mapping", "[error]") {
    CHECK_FALSE(error_from_http_status(200));
    CHECK_FALSE(error_from_http_status(206));
    CHECK(error_from_http_status(404) == TransferErrc::not_found);
    CHECK(error_from_http_status(410) == TransferErrc::not_found);
    CHECK(error_from_http_status(401) == TransferErrc::unauthorized);
    CHECK(error_from_http_status(403) == TransferErrc::unauthorized);
    CHECK(error_from_http_status(416) == TransferErrc::range_not_satisfiable);
    CHECK(error_from_http_status(429) == TransferErrc::server_error);
    CHECK(error_from_http_status(503) == TransferErrc::server_error);
    CHECK(error_from_http_status(400) == TransferErrc::client_error);
}

TEST_CASE("Error classification", "[error]") {
    SECTION("No error") {
        CHECK(classify({}) == ErrorKind::none);
    }

    SECTION("Transient network failures are retried") {
        CHECK(classify(TransferErrc::timeout) == ErrorKind::transient_network);
        CHECK(classify(TransferErrc::connection_lost) == ErrorKind::transient_network);
        CHECK(classify(TransferErrc::dns_error) == ErrorKind::transient_network);
        CHECK(classify(TransferErrc::refused) == ErrorKind::transient_network);
        CHECK(classify(TransferErrc::server_error) == ErrorKind::transient_network);
    }

    SECTION("Range rejection restarts from zero") {
        CHECK(classify(TransferErrc::range_ignored) == ErrorKind::server_rejected_range);
        CHECK(classify(TransferErrc::range_not_satisfiable) == ErrorKind::server_rejected_range);
    }

    SECTION("Client errors are terminal") {
        CHECK(classify(TransferErrc::not_found) == ErrorKind::non_recoverable_server);
        CHECK(classify(TransferErrc::unauthorized) == ErrorKind::non_recoverable_server);
        CHECK(classify(TransferErrc::ssl_error) == ErrorKind::non_recoverable_server);
        CHECK(classify(TransferErrc::size_mismatch) == ErrorKind::non_recoverable_server);
    }

    SECTION("Disk errors are local I/O") {
        CHECK(classify(haul::disk::DiskErrc::disk_full) == ErrorKind::local_io);
        CHECK(classify(haul::disk::DiskErrc::access_denied) == ErrorKind::local_io);
        CHECK(classify(haul::disk::DiskErrc::corrupt_record) == ErrorKind::corrupt_resume_state);
        CHECK(classify(std::error_code(EIO, std::generic_category())) == ErrorKind::local_io);
    }

    SECTION("Cancellation is not a failure") {
        CHECK(classify(TransferErrc::cancelled) == ErrorKind::cancellation);
    }
}

TEST_CASE("errno translation", "[error]") {
    using haul::disk::DiskErrc;
    CHECK_FALSE(haul::disk::error_from_errno(0));
    CHECK(haul::disk::error_from_errno(ENOSPC) == DiskErrc::disk_full);
    CHECK(haul::disk::error_from_errno(EACCES) == DiskErrc::access_denied);
    CHECK(haul::disk::error_from_errno(ENOENT) == DiskErrc::file_not_found);
}

TEST_CASE("Error messages", "[error]") {
    std::error_code ec = TransferErrc::range_ignored;
    CHECK(ec.category().name() == std::string("haul::transfer"));
    CHECK(ec.message() == "Server ignored the range request");
    CHECK(std::string(to_string(ErrorKind::transient_network)) == "transient network error");
}
