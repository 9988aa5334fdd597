// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/resume_ledger.hpp>
#include <haul/core/transfer_task.hpp>
#include <haul/disk/file_writer.hpp>
#include "support/fake_fetcher.hpp"
#include "support/temp_dir.hpp"
#include <mutex>
#include <vector>

using namespace haul::core;
using namespace std::chrono_literals;
using haul::test::FakeFetcher;
using haul::test::FakeResource;
using haul::test::TempDir;
using haul::test::eventually;

namespace {

constexpr const char* URL = "https://example.com/blob.bin";

EngineConfig fast_config() {
    EngineConfig cfg;
    cfg.retry_limit = 3;
    cfg.backoff_initial = 1ms;
    cfg.backoff_max = 4ms;
    cfg.progress_interval = 5ms;
    cfg.ledger_interval = 5ms;
    return cfg;
}

FakeResource resource(std::size_t size) {
    FakeResource res;
    res.payload = haul::test::make_payload(size);
    return res;
}

// Collects state changes delivered by a task
struct StateLog {
    std::mutex mutex;
    std::vector<TransferState> states;

    EventCallback callback() {
        return [this](const ProgressEvent& e) {
            if (!e.state_change) return;
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(e.state);
        };
    }

    std::vector<TransferState> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }
};

} // namespace

TEST_CASE("TransferTask - fresh download", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(10 * 1024 + 17);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("out/blob.bin");
    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    StateLog log;
    task.callback(log.callback());

    CHECK(task.state() == TransferState::pending);
    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK_FALSE(task.error());
    CHECK(haul::test::read_file(dest) == payload);
    CHECK_FALSE(ResumeLedger::load(dest).has_value());

    auto p = task.progress();
    CHECK(p.bytes_done == payload.size());
    REQUIRE(p.bytes_total.has_value());
    CHECK(*p.bytes_total == payload.size());

    CHECK(log.snapshot() == std::vector<TransferState>{
        TransferState::probing, TransferState::downloading, TransferState::completed});
    CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0});
}

TEST_CASE("TransferTask - pause and resume continue at the same byte", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(16 * 1024);
    res.hold_after = 4096;
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("blob.bin");
    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());

    REQUIRE(eventually([&] { return fetcher->holding() == 1; }));
    CHECK(task.state() == TransferState::downloading);

    task.pause();
    REQUIRE(task.wait_idle(5s));
    CHECK(task.state() == TransferState::paused);
    CHECK(*haul::disk::file_size(dest) == 4096);

    auto record = ResumeLedger::load(dest);
    REQUIRE(record.has_value());
    CHECK(record->bytes_written == 4096);
    CHECK(record->source_url == URL);

    // Pausing twice is harmless
    task.pause();
    CHECK(task.state() == TransferState::paused);

    fetcher->release();
    task.resume();
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK(haul::test::read_file(dest) == payload);
    CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0, 4096});
    CHECK(fetcher->probe_calls(URL) == 1);
    CHECK_FALSE(ResumeLedger::load(dest).has_value());
}

TEST_CASE("TransferTask - resumes a partial file left by an earlier run", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(20000);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("blob.bin");
    haul::test::write_file(dest, std::string_view(payload).substr(0, 7000));
    ResumeRecord record{dest, URL, 5000, payload.size(), 0};
    REQUIRE_FALSE(ResumeLedger::save(record));

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{5000});
    CHECK(haul::test::read_file(dest) == payload);
}

TEST_CASE("TransferTask - record from another URL starts over", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(8000);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("blob.bin");
    haul::test::write_file(dest, std::string(3000, 'x'));
    REQUIRE_FALSE(ResumeLedger::save({dest, "https://other.example.com/x", 3000, std::nullopt, 0}));

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0});
    CHECK(haul::test::read_file(dest) == payload);
}

TEST_CASE("TransferTask - ignored range restarts from zero", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(12000);
    res.honor_range = false;
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("blob.bin");
    haul::test::write_file(dest, std::string_view(payload).substr(0, 5000));
    REQUIRE_FALSE(ResumeLedger::save({dest, URL, 5000, payload.size(), 0}));

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{5000, 0});
    // Exactly one copy of the payload, never a re-send appended to the partial
    CHECK(haul::test::read_file(dest) == payload);
}

TEST_CASE("TransferTask - already complete file is not fetched again", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(4096);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));

    auto dest = dir.file("blob.bin");
    haul::test::write_file(dest, payload);

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));

    CHECK(task.state() == TransferState::completed);
    CHECK(fetcher->fetch_calls(URL) == 0);
    CHECK(task.progress().bytes_done == 4096);
    CHECK(task.reason() == "already complete");
}

TEST_CASE("TransferTask - cancel", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(16 * 1024);
    res.hold_after = 2048;
    fetcher->add(URL, std::move(res));
    auto dest = dir.file("blob.bin");

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    REQUIRE_FALSE(task.start());
    REQUIRE(eventually([&] { return fetcher->holding() == 1; }));

    SECTION("Partial data is kept by default") {
        task.cancel();
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::cancelled);
        CHECK(task.error() == TransferErrc::cancelled);
        CHECK(*haul::disk::file_size(dest) == 2048);
        auto record = ResumeLedger::load(dest);
        REQUIRE(record.has_value());
        CHECK(record->bytes_written == 2048);
    }

    SECTION("Partial data is removed on request") {
        task.cancel(true);
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::cancelled);
        CHECK_FALSE(haul::disk::file_size(dest).has_value());
        CHECK_FALSE(ResumeLedger::load(dest).has_value());
    }

    // Cancelling again changes nothing
    task.cancel();
    CHECK(task.state() == TransferState::cancelled);
}

TEST_CASE("TransferTask - cancel before start settles immediately", "[task]") {
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->add(URL, resource(100));
    TempDir dir;

    TransferTask task({URL, dir.file("never.bin"), std::nullopt}, fetcher, fast_config());
    StateLog log;
    task.callback(log.callback());

    task.pause();
    CHECK(task.state() == TransferState::pending);

    task.cancel();
    CHECK(task.state() == TransferState::cancelled);
    CHECK_FALSE(task.active());
    CHECK(fetcher->probe_calls(URL) == 0);
    CHECK(log.snapshot() == std::vector<TransferState>{TransferState::cancelled});
}

TEST_CASE("TransferTask - pause holds a start that has not begun", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(5000);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));
    auto dest = dir.file("blob.bin");

    // Runs happen only when the test calls run(), like a worker that took the ticket
    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    int launches = 0;
    task.launcher([&launches] { ++launches; });

    REQUIRE_FALSE(task.start());
    CHECK(launches == 1);
    CHECK(task.active());

    task.pause();
    task.run();

    CHECK(task.state() == TransferState::pending);
    CHECK_FALSE(task.active());
    CHECK(fetcher->probe_calls(URL) == 0);
    CHECK(fetcher->fetch_calls(URL) == 0);

    task.resume();
    CHECK(launches == 2);
    task.run();

    CHECK(task.state() == TransferState::completed);
    CHECK(haul::test::read_file(dest) == payload);
    CHECK(fetcher->fetch_calls(URL) == 1);
}

TEST_CASE("TransferTask - resume leaves an unstarted task alone", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->add(URL, resource(100));

    TransferTask task({URL, dir.file("idle.bin"), std::nullopt}, fetcher, fast_config());
    int launches = 0;
    task.launcher([&launches] { ++launches; });

    task.resume();
    CHECK(launches == 0);
    CHECK(task.state() == TransferState::pending);
    CHECK_FALSE(task.active());
}

TEST_CASE("TransferTask - restart after cancel", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto res = resource(3000);
    auto payload = res.payload;
    fetcher->add(URL, std::move(res));
    auto dest = dir.file("blob.bin");

    TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
    task.cancel();
    REQUIRE(task.state() == TransferState::cancelled);

    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));
    CHECK(task.state() == TransferState::completed);
    CHECK(haul::test::read_file(dest) == payload);
}

TEST_CASE("TransferTask - transient failures", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto dest = dir.file("blob.bin");
    auto cfg = fast_config();

    SECTION("Retries are exhausted after limit + 1 attempts") {
        auto res = resource(5000);
        res.fail_every = true;
        fetcher->add(URL, std::move(res));
        cfg.retry_limit = 2;

        TransferTask task({URL, dest, std::nullopt}, fetcher, cfg);
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::failed);
        CHECK(task.error() == TransferErrc::retries_exhausted);
        CHECK_THAT(task.reason(), Catch::Matchers::ContainsSubstring("gave up after 2 retries"));
        CHECK(fetcher->fetch_calls(URL) == 3);
    }

    SECTION("Each attempt continues where the last one dropped") {
        auto res = resource(4500);
        res.cut_after = {1000, 1000, 1000};
        auto payload = res.payload;
        fetcher->add(URL, std::move(res));
        cfg.retry_limit = 1;

        TransferTask task({URL, dest, std::nullopt}, fetcher, cfg);
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        // Progress resets the retry budget, so one retry per drop is enough
        CHECK(task.state() == TransferState::completed);
        CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0, 1000, 2000, 3000});
        CHECK(haul::test::read_file(dest) == payload);
    }

    SECTION("Failed task keeps its progress for a later retry") {
        auto res = resource(6000);
        res.cut_after = {2500, 0};
        auto payload = res.payload;
        fetcher->add(URL, std::move(res));
        cfg.retry_limit = 0;

        TransferTask task({URL, dest, std::nullopt}, fetcher, cfg);
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::failed);
        CHECK(*haul::disk::file_size(dest) == 2500);

        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::failed);

        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::completed);
        CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0, 2500, 2500});
        CHECK(haul::test::read_file(dest) == payload);
    }

    SECTION("Server without ranges restarts each attempt from zero") {
        auto res = resource(3000);
        res.accepts_ranges = false;
        res.cut_after = {1000};
        auto payload = res.payload;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, std::nullopt}, fetcher, cfg);
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::completed);
        CHECK(fetcher->offsets(URL) == std::vector<std::uint64_t>{0, 0});
        CHECK(haul::test::read_file(dest) == payload);
        CHECK_FALSE(ResumeLedger::load(dest).has_value());
    }
}

TEST_CASE("TransferTask - probe", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    auto dest = dir.file("blob.bin");

    SECTION("Permanent probe failure") {
        auto res = resource(100);
        res.probe_error = TransferErrc::not_found;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::failed);
        CHECK(task.error() == TransferErrc::probe_failed);
        CHECK_THAT(task.reason(), Catch::Matchers::StartsWith("probe failed"));
        CHECK(fetcher->probe_calls(URL) == 1);
        CHECK(fetcher->fetch_calls(URL) == 0);
    }

    SECTION("Transient probe failures are retried") {
        auto res = resource(100);
        res.probe_failures = 2;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::completed);
        CHECK(fetcher->probe_calls(URL) == 3);
    }

    SECTION("Unknown size completes at end of stream") {
        auto res = resource(2500);
        res.report_size = false;
        auto payload = res.payload;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::completed);
        CHECK_FALSE(task.progress().bytes_total.has_value());
        CHECK(haul::test::read_file(dest) == payload);
    }

    SECTION("Listed size is used when the server does not report one") {
        auto res = resource(2500);
        res.report_size = false;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, 2500}, fetcher, fast_config());
        CHECK(task.progress().bytes_total == 2500);
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));
        CHECK(task.state() == TransferState::completed);
    }

    SECTION("More bytes than announced is a size mismatch") {
        auto res = resource(3000);
        res.reported_size = 1000;
        fetcher->add(URL, std::move(res));

        TransferTask task({URL, dest, std::nullopt}, fetcher, fast_config());
        REQUIRE_FALSE(task.start());
        REQUIRE(task.wait_idle(5s));

        CHECK(task.state() == TransferState::failed);
        CHECK(task.error() == TransferErrc::size_mismatch);
    }
}

TEST_CASE("TransferTask - invalid input", "[task]") {
    auto fetcher = std::make_shared<FakeFetcher>();

    TransferTask bad_url({"ftp://example.com/x", "x.bin", std::nullopt}, fetcher);
    CHECK(bad_url.start() == TransferErrc::invalid_url);
    CHECK(bad_url.state() == TransferState::pending);

    TransferTask bad_path({URL, "", std::nullopt}, fetcher);
    CHECK(bad_path.start() == TransferErrc::invalid_path);

    TransferTask no_fetcher({URL, "x.bin", std::nullopt}, nullptr);
    CHECK(no_fetcher.start() == TransferErrc::invalid_state);
}

TEST_CASE("TransferTask - progress samples are throttled", "[task]") {
    TempDir dir;
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->chunk_size = 256;
    fetcher->add(URL, resource(64 * 1024));

    auto cfg = fast_config();
    cfg.progress_interval = 10s;

    std::mutex mutex;
    std::size_t samples = 0;
    TransferTask task({URL, dir.file("blob.bin"), std::nullopt}, fetcher, cfg);
    task.callback([&](const ProgressEvent& e) {
        if (e.state_change) return;
        std::lock_guard<std::mutex> lock(mutex);
        ++samples;
    });

    REQUIRE_FALSE(task.start());
    REQUIRE(task.wait_idle(5s));
    CHECK(task.state() == TransferState::completed);

    std::lock_guard<std::mutex> lock(mutex);
    CHECK(samples == 0);
}
