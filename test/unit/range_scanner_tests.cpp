// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for RangeScanner windowing and log normalization

#include <catch2/catch.hpp>
#include "relay/range_scanner.hpp"
#include "util/errors.hpp"
#include "util/mock_chain_client.hpp"
#include <algorithm>
#include <limits>
#include <random>

using namespace bridgerelay;
using namespace bridgerelay::relay;
using bridgerelay::test::MakeLockLog;
using bridgerelay::test::MockChainClient;
using bridgerelay::test::TestFilter;
using bridgerelay::test::TestTxHash;

namespace {

constexpr uint64_t SOURCE_CHAIN = 1;
constexpr uint64_t DEST_CHAIN = 137;

Checkpoint CheckpointAt(uint64_t last_scanned_block) {
    Checkpoint cp;
    cp.chain_id = SOURCE_CHAIN;
    cp.last_scanned_block = last_scanned_block;
    return cp;
}

} // namespace

TEST_CASE("RangeScanner - NextWindow", "[relay][scanner][unit]") {
    SECTION("Confirmed range capped by the confirmation lag") {
        auto w = RangeScanner::NextWindow(CheckpointAt(100), 150, 100, 12);
        REQUIRE(w.has_value());
        REQUIRE(w->from_block == 101);
        REQUIRE(w->to_block == 138);
    }

    SECTION("Window capped by max_window_size") {
        auto w = RangeScanner::NextWindow(CheckpointAt(100), 10000, 100, 12);
        REQUIRE(w.has_value());
        REQUIRE(*w == ScanWindow{101, 200});
        REQUIRE(w->size() == 100);
    }

    SECTION("Single confirmed block") {
        auto w = RangeScanner::NextWindow(CheckpointAt(137), 150, 100, 12);
        REQUIRE(w.has_value());
        REQUIRE(*w == ScanWindow{138, 138});
    }

    SECTION("Nothing new once caught up") {
        REQUIRE_FALSE(RangeScanner::NextWindow(CheckpointAt(138), 150, 100, 12));
        REQUIRE_FALSE(RangeScanner::NextWindow(CheckpointAt(200), 150, 100, 12));
    }

    SECTION("Tip below the lag") {
        REQUIRE_FALSE(RangeScanner::NextWindow(CheckpointAt(0), 5, 100, 12));
    }

    SECTION("Zero lag scans up to the tip") {
        auto w = RangeScanner::NextWindow(CheckpointAt(0), 5, 100, 0);
        REQUIRE(w.has_value());
        REQUIRE(*w == ScanWindow{1, 5});
    }

    SECTION("Zero window size never scans") {
        REQUIRE_FALSE(RangeScanner::NextWindow(CheckpointAt(0), 1000, 0, 12));
    }

    SECTION("No overflow near the top of the range") {
        constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
        REQUIRE_FALSE(RangeScanner::NextWindow(CheckpointAt(max), max, 100, 0));

        auto w = RangeScanner::NextWindow(CheckpointAt(max - 10), max, 100, 0);
        REQUIRE(w.has_value());
        REQUIRE(w->from_block == max - 9);
        REQUIRE(w->to_block == max);
    }
}

TEST_CASE("RangeScanner - Events come back ordered", "[relay][scanner][unit]") {
    MockChainClient source(SOURCE_CHAIN);
    RangeScanner scanner(source, TestFilter(), SOURCE_CHAIN, DEST_CHAIN);

    // (block, log_index) pairs spread over several blocks
    std::vector<std::pair<uint64_t, uint32_t>> positions = {
        {101, 0}, {101, 3}, {105, 1}, {105, 2}, {120, 0}, {120, 7}, {138, 4}};
    for (size_t i = 0; i < positions.size(); ++i) {
        source.logs.push_back(MakeLockLog(positions[i].first, TestTxHash(i + 1),
                                          positions[i].second, 100, DEST_CHAIN));
    }

    std::mt19937 rng(1234);
    for (int round = 0; round < 10; ++round) {
        std::shuffle(source.logs.begin(), source.logs.end(), rng);

        auto events = scanner.Scan(ScanWindow{101, 138});
        REQUIRE(events.size() == positions.size());
        for (size_t i = 0; i < events.size(); ++i) {
            CHECK(events[i].source_block_number == positions[i].first);
            CHECK(events[i].log_index == positions[i].second);
        }
    }

    REQUIRE(source.log_queries.back() == (std::pair<uint64_t, uint64_t>{101, 138}));
}

TEST_CASE("RangeScanner - Normalization", "[relay][scanner][unit]") {
    MockChainClient source(SOURCE_CHAIN);
    RangeScanner scanner(source, TestFilter(), SOURCE_CHAIN, DEST_CHAIN);
    const ScanWindow window{101, 138};

    auto good = MakeLockLog(110, TestTxHash(1), 2, 500, DEST_CHAIN);

    SECTION("Well-formed log becomes a DomainEvent") {
        auto events = scanner.Normalize({good}, window);
        REQUIRE(events.size() == 1);
        const auto& ev = events[0];
        REQUIRE(ev.source_chain_id == SOURCE_CHAIN);
        REQUIRE(ev.source_block_number == 110);
        REQUIRE(ev.source_tx_hash == TestTxHash(1));
        REQUIRE(ev.log_index == 2);
        REQUIRE(ev.asset_id == test::TestAddress(1));
        REQUIRE(ev.sender == test::TestAddress(2));
        REQUIRE(ev.recipient == test::TestAddress(3));
        REQUIRE(ev.amount == uint256::FromUint64(500));
        REQUIRE(ev.destination_chain_id == DEST_CHAIN);
    }

    SECTION("Removed (reorged) logs are dropped") {
        auto log = good;
        log.removed = true;
        REQUIRE(scanner.Normalize({log}, window).empty());
    }

    SECTION("Pending logs without position are dropped") {
        auto no_block = good;
        no_block.block_number.reset();
        auto no_index = good;
        no_index.log_index.reset();
        auto no_tx = good;
        no_tx.tx_hash.reset();
        REQUIRE(scanner.Normalize({no_block, no_index, no_tx}, window).empty());
    }

    SECTION("Logs outside the window are dropped") {
        auto before = MakeLockLog(100, TestTxHash(2), 0, 1, DEST_CHAIN);
        auto after = MakeLockLog(139, TestTxHash(3), 0, 1, DEST_CHAIN);
        auto events = scanner.Normalize({before, good, after}, window);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].source_block_number == 110);
    }

    SECTION("Other contracts and other events are dropped") {
        auto other_contract = good;
        other_contract.address = test::TestAddress(9);
        auto other_event = good;
        other_event.topics[0] = TestTxHash(99);
        auto no_topics = good;
        no_topics.topics.clear();
        REQUIRE(scanner.Normalize({other_contract, other_event, no_topics}, window).empty());
    }

    SECTION("Undecodable payloads are dropped") {
        auto short_data = good;
        short_data.data.resize(32);
        auto dirty_address = good;
        dirty_address.topics[3].data()[0] = 0x01; // non-zero padding
        auto missing_topic = good;
        missing_topic.topics.pop_back();
        REQUIRE(scanner.Normalize({short_data, dirty_address, missing_topic}, window).empty());
    }

    SECTION("Locks for other destination chains are dropped") {
        auto elsewhere = MakeLockLog(111, TestTxHash(4), 0, 1, DEST_CHAIN + 1);
        auto events = scanner.Normalize({elsewhere, good}, window);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].source_tx_hash == TestTxHash(1));
    }

    SECTION("Duplicate entries collapse to one event") {
        auto events = scanner.Normalize({good, good}, window);
        REQUIRE(events.size() == 1);
    }

    SECTION("Same position in different transactions orders by tx hash") {
        auto a = MakeLockLog(110, TestTxHash(9), 2, 1, DEST_CHAIN);
        auto b = MakeLockLog(110, TestTxHash(8), 2, 1, DEST_CHAIN);
        auto events = scanner.Normalize({a, b}, window);
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].source_tx_hash == TestTxHash(8));
    }
}

TEST_CASE("RangeScanner - Fetch failures propagate", "[relay][scanner][unit]") {
    MockChainClient source(SOURCE_CHAIN);
    source.fail_logs = true;
    RangeScanner scanner(source, TestFilter(), SOURCE_CHAIN, DEST_CHAIN);
    REQUIRE_THROWS_AS(scanner.Scan(ScanWindow{1, 10}), TransientFetchError);
}
