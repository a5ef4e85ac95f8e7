// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for ActionBuilder

#include <catch2/catch.hpp>
#include "relay/action_builder.hpp"
#include "util/errors.hpp"
#include "util/mock_chain_client.hpp"

using namespace bridgerelay;
using namespace bridgerelay::relay;

namespace {

constexpr uint64_t SOURCE_CHAIN = 1;
constexpr uint64_t DEST_CHAIN = 137;

chain::DomainEvent MakeEvent() {
    chain::DomainEvent ev;
    ev.source_chain_id = SOURCE_CHAIN;
    ev.source_block_number = 120;
    ev.source_tx_hash = *uint256::FromHex(
        "0x0000000000000000000000000000000000000000000000000000000000000abc");
    ev.log_index = 0;
    ev.sender = test::TestAddress(2);
    ev.recipient = test::TestAddress(3);
    ev.amount = uint256::FromUint64(100);
    ev.asset_id = *Address::FromHex("0xdac17f958d2ee523a2206206994597c13d831ec7");
    ev.destination_chain_id = DEST_CHAIN;
    return ev;
}

} // namespace

TEST_CASE("ActionBuilder - Mint action from a lock event", "[relay][builder][unit]") {
    ActionBuilder builder(DEST_CHAIN);
    auto ev = MakeEvent();

    auto action = builder.Build(ev);
    REQUIRE(action.destination_chain_id == DEST_CHAIN);
    REQUIRE(action.recipient == ev.recipient);
    REQUIRE(action.amount == uint256::FromUint64(100));
    REQUIRE(action.asset_id == ev.asset_id);
    REQUIRE(action.idempotency_key.source_chain_id == SOURCE_CHAIN);
    REQUIRE(action.idempotency_key.tx_hash == ev.source_tx_hash);
    REQUIRE(action.idempotency_key.log_index == 0);
    REQUIRE(action.idempotency_key == ev.Id());

    SECTION("Rebuilding is byte-identical") {
        auto again = builder.Build(ev);
        REQUIRE(again.Serialize() == action.Serialize());
        REQUIRE(again == action);

        // A fresh builder gives the same bytes too
        ActionBuilder other(DEST_CHAIN);
        REQUIRE(other.Build(ev).Serialize() == action.Serialize());
    }

    SECTION("Different log index gives a different key") {
        auto ev2 = ev;
        ev2.log_index = 1;
        auto action2 = builder.Build(ev2);
        REQUIRE(action2.idempotency_key != action.idempotency_key);
        REQUIRE_FALSE(action2 == action);
    }

    SECTION("Sender does not affect the action") {
        auto ev2 = ev;
        ev2.sender = test::TestAddress(42);
        REQUIRE(builder.Build(ev2) == action);
    }
}

TEST_CASE("ActionBuilder - Nonce hint preserves scan order", "[relay][builder][unit]") {
    REQUIRE(ActionBuilder::NonceHint(120, 0) == (uint64_t{120} << 32));
    REQUIRE(ActionBuilder::NonceHint(120, 5) == ((uint64_t{120} << 32) | 5));
    REQUIRE(ActionBuilder::NonceHint(120, 0xffffffff) < ActionBuilder::NonceHint(121, 0));
    REQUIRE(ActionBuilder::NonceHint(120, 1) < ActionBuilder::NonceHint(120, 2));

    ActionBuilder builder(DEST_CHAIN);
    auto ev = MakeEvent();
    ev.log_index = 7;
    REQUIRE(builder.Build(ev).nonce_hint == ActionBuilder::NonceHint(120, 7));
}

TEST_CASE("ActionBuilder - Malformed events", "[relay][builder][unit]") {
    ActionBuilder builder(DEST_CHAIN);
    auto ev = MakeEvent();

    SECTION("Zero amount") {
        ev.amount.SetNull();
        REQUIRE_THROWS_AS(builder.Build(ev), MalformedEventError);
    }

    SECTION("Null recipient") {
        ev.recipient.SetNull();
        REQUIRE_THROWS_AS(builder.Build(ev), MalformedEventError);
    }

    SECTION("Null asset") {
        ev.asset_id.SetNull();
        REQUIRE_THROWS_AS(builder.Build(ev), MalformedEventError);
    }

    SECTION("Null transaction hash") {
        ev.source_tx_hash.SetNull();
        REQUIRE_THROWS_AS(builder.Build(ev), MalformedEventError);
    }

    SECTION("Wrong destination chain") {
        ev.destination_chain_id = DEST_CHAIN + 1;
        REQUIRE_THROWS_AS(builder.Build(ev), MalformedEventError);
    }
}

TEST_CASE("ActionBuilder - Serialized layout", "[relay][builder][unit]") {
    ActionBuilder builder(DEST_CHAIN);
    auto bytes = builder.Build(MakeEvent()).Serialize();

    // chain id | recipient | amount | asset | source chain | tx | log index | nonce
    REQUIRE(bytes.size() == 8 + 20 + 32 + 20 + 8 + 32 + 4 + 8);
    // Destination chain id, big-endian
    REQUIRE(bytes[7] == DEST_CHAIN);
    REQUIRE(bytes[0] == 0);
}
