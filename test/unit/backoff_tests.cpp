// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for BackoffPolicy

#include <catch2/catch.hpp>
#include "relay/backoff.hpp"
#include <string>

using namespace bridgerelay::relay;
using std::chrono::milliseconds;

TEST_CASE("BackoffPolicy - Normal polling", "[relay][backoff][unit]") {
    BackoffPolicy policy(milliseconds(30000), milliseconds(300000));

    REQUIRE(policy.NextDelay(CycleOutcome::Idle) == milliseconds(30000));
    REQUIRE(policy.NextDelay(CycleOutcome::Progress) == milliseconds(30000));

    SECTION("Catch-up skips the wait") {
        REQUIRE(policy.NextDelay(CycleOutcome::Progress, true) == milliseconds(0));
    }

    SECTION("Cancelled cycles do not wait") {
        REQUIRE(policy.NextDelay(CycleOutcome::Cancelled) == milliseconds(0));
    }
}

TEST_CASE("BackoffPolicy - Exponential backoff on failures", "[relay][backoff][unit]") {
    BackoffPolicy policy(milliseconds(30000), milliseconds(300000));

    REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(30000));
    REQUIRE(policy.NextDelay(CycleOutcome::SubmissionFailure) == milliseconds(60000));
    REQUIRE(policy.NextDelay(CycleOutcome::StorageFailure) == milliseconds(120000));
    REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(240000));
    REQUIRE(policy.ConsecutiveFailures() == 4);

    SECTION("Capped at max_backoff") {
        REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(300000));
        for (int i = 0; i < 100; ++i) {
            REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(300000));
        }
    }

    SECTION("Progress resets the streak") {
        policy.NextDelay(CycleOutcome::Progress);
        REQUIRE(policy.ConsecutiveFailures() == 0);
        REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(30000));
    }

    SECTION("Idle resets the streak") {
        policy.NextDelay(CycleOutcome::Idle);
        REQUIRE(policy.NextDelay(CycleOutcome::SubmissionFailure) == milliseconds(30000));
    }

    SECTION("Explicit reset") {
        policy.Reset();
        REQUIRE(policy.ConsecutiveFailures() == 0);
    }
}

TEST_CASE("BackoffPolicy - Cap below the interval", "[relay][backoff][unit]") {
    // Never waits less than the polling interval after a failure
    BackoffPolicy policy(milliseconds(1000), milliseconds(10));
    REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(1000));
    REQUIRE(policy.NextDelay(CycleOutcome::TransientFailure) == milliseconds(1000));
}

TEST_CASE("BackoffPolicy - Outcome names", "[relay][backoff][unit]") {
    REQUIRE(std::string(CycleOutcomeName(CycleOutcome::Progress)) == "progress");
    REQUIRE(std::string(CycleOutcomeName(CycleOutcome::SubmissionFailure)) == "submission-failure");
}
