// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/progress.hpp>
#include <haul/core/transfer_state.hpp>

using namespace haul::core;
using S = TransferState;

TEST_CASE("TransferState names", "[state]") {
    CHECK(std::string(to_string(S::pending)) == "pending");
    CHECK(std::string(to_string(S::downloading)) == "downloading");
    CHECK(std::string(to_string(S::failed)) == "failed");
}

TEST_CASE("Terminal states", "[state]") {
    CHECK(is_terminal(S::completed));
    CHECK(is_terminal(S::failed));
    CHECK(is_terminal(S::cancelled));
    CHECK_FALSE(is_terminal(S::pending));
    CHECK_FALSE(is_terminal(S::paused));
    CHECK_FALSE(is_terminal(S::downloading));
}

TEST_CASE("Transition table", "[state]") {
    SECTION("Happy path") {
        CHECK(can_transition(S::pending, S::probing));
        CHECK(can_transition(S::probing, S::downloading));
        CHECK(can_transition(S::downloading, S::completed));
    }

    SECTION("Probe may finish the task outright") {
        CHECK(can_transition(S::probing, S::completed));
        CHECK(can_transition(S::probing, S::failed));
    }

    SECTION("Pause and resume") {
        CHECK(can_transition(S::downloading, S::paused));
        CHECK(can_transition(S::paused, S::downloading));
        CHECK(can_transition(S::paused, S::probing));
        CHECK(can_transition(S::paused, S::cancelled));
        CHECK_FALSE(can_transition(S::paused, S::completed));
        CHECK_FALSE(can_transition(S::pending, S::paused));
    }

    SECTION("Terminal states only restart through probing") {
        for (auto from : {S::completed, S::failed, S::cancelled}) {
            CHECK(can_transition(from, S::probing));
            CHECK_FALSE(can_transition(from, S::downloading));
            CHECK_FALSE(can_transition(from, S::paused));
        }
    }

    SECTION("No skipping the probe") {
        CHECK_FALSE(can_transition(S::pending, S::downloading));
        CHECK_FALSE(can_transition(S::pending, S::completed));
    }
}

TEST_CASE("RateMeter", "[progress]") {
    using namespace std::chrono_literals;
    RateMeter meter{100ms};
    auto t0 = RateMeter::clock::now();
    meter.reset(t0);

    meter.add(500, t0 + 50ms);
    CHECK(meter.rate_bps() == 0);

    meter.add(500, t0 + 100ms);
    CHECK(meter.rate_bps() == 10000);

    meter.add(100, t0 + 300ms);
    CHECK(meter.rate_bps() == 500);
}

TEST_CASE("ETA and percent", "[progress]") {
    CHECK_FALSE(estimate_eta(10, std::nullopt, 100).has_value());
    CHECK_FALSE(estimate_eta(10, 100, 0).has_value());
    CHECK(estimate_eta(100, 100, 5) == 0);
    CHECK(estimate_eta(0, 1000, 100) == 10);

    TransferProgress p;
    CHECK(p.percent() == 0.0);
    p.bytes_done = 25;
    p.bytes_total = 100;
    CHECK(p.percent() == Catch::Approx(25.0));
}
