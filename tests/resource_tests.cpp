// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/resource.hpp>

using namespace haul::core;

TEST_CASE("validate(ResourceRef)", "[resource]") {
    CHECK_FALSE(validate({"https://example.com/a.bin", "out/a.bin", std::nullopt}));
    CHECK(validate({"ftp://example.com/a.bin", "a.bin", std::nullopt}) == TransferErrc::invalid_url);
    CHECK(validate({"not a url", "a.bin", std::nullopt}) == TransferErrc::invalid_url);
    CHECK(validate({"http://example.com/a.bin", "", std::nullopt}) == TransferErrc::invalid_path);
}

TEST_CASE("build_refs mirrors the listing", "[resource]") {
    std::vector<ListingEntry> listing{
        {"config.json", 512},
        {"weights/part-0001.bin", std::nullopt},
        {"docs/read me.md", 10},
    };

    auto refs = build_refs("https://hub.example.com/org/repo/resolve/main", listing, "/tmp/models/repo");
    REQUIRE(refs.has_value());
    REQUIRE(refs->size() == 3);

    CHECK((*refs)[0].source_url == "https://hub.example.com/org/repo/resolve/main/config.json");
    CHECK((*refs)[0].destination_path == "/tmp/models/repo/config.json");
    CHECK((*refs)[0].expected_size == 512);

    CHECK((*refs)[1].destination_path == "/tmp/models/repo/weights/part-0001.bin");
    CHECK_FALSE((*refs)[1].expected_size.has_value());

    CHECK((*refs)[2].source_url == "https://hub.example.com/org/repo/resolve/main/docs/read%20me.md");
}

TEST_CASE("build_refs rejects unsafe entries", "[resource]") {
    SECTION("Parent traversal") {
        auto refs = build_refs("https://example.com/base", {{"../etc/passwd", std::nullopt}}, "out");
        REQUIRE_FALSE(refs.has_value());
        CHECK(refs.error() == TransferErrc::invalid_path);
    }

    SECTION("Nested traversal") {
        CHECK_FALSE(build_refs("https://example.com/base", {{"a/../../b", std::nullopt}}, "out").has_value());
    }

    SECTION("Absolute path") {
        CHECK_FALSE(build_refs("https://example.com/base", {{"/abs.bin", std::nullopt}}, "out").has_value());
    }

    SECTION("Empty entry") {
        CHECK_FALSE(build_refs("https://example.com/base", {{"", std::nullopt}}, "out").has_value());
    }

    SECTION("Bad base URL") {
        auto refs = build_refs("file:///srv", {{"a", std::nullopt}}, "out");
        REQUIRE_FALSE(refs.has_value());
        CHECK(refs.error() == TransferErrc::invalid_url);
    }
}

TEST_CASE("build_refs defaults to the working directory", "[resource]") {
    auto refs = build_refs("http://localhost:9000/", {{"sub/x.bin", std::nullopt}}, "");
    REQUIRE(refs.has_value());
    CHECK((*refs)[0].destination_path == "sub/x.bin");
}
