// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for relayer configuration loading and validation

#include <catch2/catch.hpp>
#include "app/config.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>

using namespace bridgerelay::app;

namespace {

class ConfigTestFixture {
public:
    std::filesystem::path test_dir;

    ConfigTestFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = std::filesystem::temp_directory_path() /
                   ("bridgerelay_config_test_" + std::to_string(now));
        std::filesystem::create_directories(test_dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::filesystem::path Write(const std::string& contents) const {
        auto path = test_dir / "relayer.json";
        REQUIRE(bridgerelay::util::atomic_write_file(path, contents) == bridgerelay::util::WriteResult::Ok);
        return path;
    }
};

RelayerConfig ValidConfig() {
    RelayerConfig config;
    config.source.rpc_url = "http://127.0.0.1:8545";
    config.source.chain_id = 1;
    config.source.bridge_contract = "0x00000000000000000000000000000000000b71d6";
    config.source.event_topic =
        "0x9f3a0b7b6a1f3e8a3b8f6f1c2d9a07c4d1e0b2f3a4c5d6e7f8091a2b3c4d5e6f";
    config.destination.rpc_url = "http://127.0.0.1:9545/rpc";
    config.destination.chain_id = 137;
    config.destination.bridge_contract = "0x00000000000000000000000000000000000c0ffe";
    config.destination.mint_selector = "0x1a2b3c4d";
    config.relayer.account = "0x00000000000000000000000000000000000000aa";
    return config;
}

bool HasProblem(const std::vector<std::string>& problems, const std::string& needle) {
    return std::any_of(problems.begin(), problems.end(), [&](const std::string& p) {
        return p.find(needle) != std::string::npos;
    });
}

} // namespace

TEST_CASE("Config - ParseStartBlock", "[app][config][unit]") {
    std::optional<uint64_t> start = 7;

    REQUIRE(ParseStartBlock("latest", start));
    REQUIRE_FALSE(start.has_value());

    REQUIRE(ParseStartBlock("0", start));
    REQUIRE(start == 0u);

    REQUIRE(ParseStartBlock("18500000", start));
    REQUIRE(start == 18500000u);

    // Rejected values leave the previous setting alone
    REQUIRE_FALSE(ParseStartBlock("", start));
    REQUIRE_FALSE(ParseStartBlock("-1", start));
    REQUIRE_FALSE(ParseStartBlock("0x10", start));
    REQUIRE_FALSE(ParseStartBlock("Latest", start));
    REQUIRE(start == 18500000u);
}

TEST_CASE("Config - Defaults", "[app][config][unit]") {
    RelayerConfig config;
    REQUIRE(config.relayer.max_window_size == 100);
    REQUIRE(config.relayer.confirmation_lag == 12);
    REQUIRE(config.relayer.polling_interval_seconds == 30);
    REQUIRE(config.relayer.max_backoff_seconds == 300);
    REQUIRE(config.relayer.dedup_capacity == 10000);
    REQUIRE_FALSE(config.relayer.start_block.has_value());
    REQUIRE_FALSE(config.relayer.dry_run);
    REQUIRE(config.destination.gas_limit == 200000);
}

TEST_CASE("Config - LoadConfigFile", "[app][config][unit]") {
    ConfigTestFixture fixture;
    RelayerConfig config;
    std::string error;

    SECTION("Complete file") {
        auto path = fixture.Write(R"({
            "source": {
                "rpc_url": "http://source:8545",
                "chain_id": 1,
                "bridge_contract": "0x00000000000000000000000000000000000b71d6",
                "event_topic": "0x9f3a0b7b6a1f3e8a3b8f6f1c2d9a07c4d1e0b2f3a4c5d6e7f8091a2b3c4d5e6f"
            },
            "destination": {
                "rpc_url": "http://dest:8545",
                "chain_id": 137,
                "bridge_contract": "0x00000000000000000000000000000000000c0ffe",
                "mint_selector": "0x1a2b3c4d",
                "gas_limit": 350000
            },
            "relayer": {
                "account": "relayer-key",
                "max_window_size": 500,
                "confirmation_lag": 64,
                "polling_interval_seconds": 12,
                "max_backoff_seconds": 120,
                "dedup_capacity": 2000,
                "start_block": 18000000,
                "rpc_timeout_seconds": 5,
                "dry_run": true
            }
        })");

        REQUIRE(LoadConfigFile(path, config, error));
        REQUIRE(error.empty());
        REQUIRE(config.source.rpc_url == "http://source:8545");
        REQUIRE(config.source.chain_id == 1);
        REQUIRE(config.destination.chain_id == 137);
        REQUIRE(config.destination.mint_selector == "0x1a2b3c4d");
        REQUIRE(config.destination.gas_limit == 350000);
        REQUIRE(config.relayer.account == "relayer-key");
        REQUIRE(config.relayer.max_window_size == 500);
        REQUIRE(config.relayer.confirmation_lag == 64);
        REQUIRE(config.relayer.polling_interval_seconds == 12);
        REQUIRE(config.relayer.max_backoff_seconds == 120);
        REQUIRE(config.relayer.dedup_capacity == 2000);
        REQUIRE(config.relayer.start_block == 18000000u);
        REQUIRE(config.relayer.rpc_timeout_seconds == 5);
        REQUIRE(config.relayer.dry_run);
    }

    SECTION("Partial file keeps existing values") {
        config.relayer.account = "from-before";
        config.relayer.confirmation_lag = 3;
        auto path = fixture.Write(R"({"relayer": {"max_window_size": 50, "account": null}})");

        REQUIRE(LoadConfigFile(path, config, error));
        REQUIRE(config.relayer.max_window_size == 50);
        REQUIRE(config.relayer.account == "from-before");
        REQUIRE(config.relayer.confirmation_lag == 3);
    }

    SECTION("start_block as a string") {
        auto path = fixture.Write(R"({"relayer": {"start_block": "latest"}})");
        config.relayer.start_block = 10;
        REQUIRE(LoadConfigFile(path, config, error));
        REQUIRE_FALSE(config.relayer.start_block.has_value());

        path = fixture.Write(R"({"relayer": {"start_block": "4242"}})");
        REQUIRE(LoadConfigFile(path, config, error));
        REQUIRE(config.relayer.start_block == 4242u);
    }

    SECTION("Bad start_block") {
        auto path = fixture.Write(R"({"relayer": {"start_block": "yesterday"}})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        REQUIRE(error.find("start_block") != std::string::npos);

        path = fixture.Write(R"({"relayer": {"start_block": -5}})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
    }

    SECTION("Invalid JSON") {
        auto path = fixture.Write("{ \"source\": ");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        REQUIRE(error.find("not valid JSON") != std::string::npos);
    }

    SECTION("Top level must be an object") {
        auto path = fixture.Write("[1, 2, 3]");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
    }

    SECTION("Sections must be objects") {
        auto path = fixture.Write(R"({"destination": "http://dest:8545"})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        REQUIRE(error.find("destination") != std::string::npos);
    }

    SECTION("Wrong field type leaves the config untouched") {
        config.relayer.max_window_size = 77;
        auto path = fixture.Write(
            R"({"relayer": {"max_window_size": 10, "confirmation_lag": "twelve"}})");
        REQUIRE_FALSE(LoadConfigFile(path, config, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(config.relayer.max_window_size == 77);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadConfigFile(fixture.test_dir / "nope.json", config, error));
        REQUIRE(error.find("does not exist") != std::string::npos);
    }
}

TEST_CASE("Config - ApplyEnvironment", "[app][config][unit]") {
    RelayerConfig config = ValidConfig();
    std::map<std::string, std::string> env = {
        {"SOURCE_CHAIN_RPC_URL", "http://env-source:8545"},
        {"RELAYER_ACCOUNT", "env-account"},
    };
    auto lookup = [&](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    ApplyEnvironment(config, lookup);
    REQUIRE(config.source.rpc_url == "http://env-source:8545");
    REQUIRE(config.relayer.account == "env-account");
    // Unset variables keep the configured value
    REQUIRE(config.destination.rpc_url == "http://127.0.0.1:9545/rpc");
}

TEST_CASE("Config - ValidateConfig", "[app][config][unit]") {
    RelayerConfig config = ValidConfig();

    SECTION("Valid config has no problems") {
        REQUIRE(ValidateConfig(config).empty());

        // chain ids of 0 mean "whatever the node says"
        config.source.chain_id = 0;
        config.destination.chain_id = 0;
        REQUIRE(ValidateConfig(config).empty());
    }

    SECTION("Missing RPC URLs") {
        config.source.rpc_url.clear();
        config.destination.rpc_url.clear();
        auto problems = ValidateConfig(config);
        REQUIRE(HasProblem(problems, "source.rpc_url is not set"));
        REQUIRE(HasProblem(problems, "destination.rpc_url is not set"));
    }

    SECTION("Only plain http endpoints") {
        config.source.rpc_url = "https://mainnet.example.org";
        REQUIRE(HasProblem(ValidateConfig(config), "source.rpc_url"));
        config.source.rpc_url = "http://host:99999";
        REQUIRE(HasProblem(ValidateConfig(config), "source.rpc_url"));
    }

    SECTION("Contract, topic and selector encodings") {
        config.source.bridge_contract = "0x1234";
        config.source.event_topic = "TokensLocked";
        config.destination.bridge_contract = "";
        config.destination.mint_selector = "0x1a2b3c";
        auto problems = ValidateConfig(config);
        REQUIRE(problems.size() == 4);
        REQUIRE(HasProblem(problems, "source.bridge_contract"));
        REQUIRE(HasProblem(problems, "source.event_topic"));
        REQUIRE(HasProblem(problems, "destination.bridge_contract"));
        REQUIRE(HasProblem(problems, "destination.mint_selector"));
    }

    SECTION("Zero-valued settings") {
        config.destination.gas_limit = 0;
        config.relayer.max_window_size = 0;
        config.relayer.dedup_capacity = 0;
        config.relayer.rpc_timeout_seconds = 0;
        auto problems = ValidateConfig(config);
        REQUIRE(HasProblem(problems, "gas_limit"));
        REQUIRE(HasProblem(problems, "max_window_size"));
        REQUIRE(HasProblem(problems, "dedup_capacity"));
        REQUIRE(HasProblem(problems, "rpc_timeout_seconds"));
    }

    SECTION("Polling and backoff") {
        config.relayer.polling_interval_seconds = 0;
        REQUIRE(HasProblem(ValidateConfig(config), "polling_interval_seconds"));

        config.relayer.polling_interval_seconds = 60;
        config.relayer.max_backoff_seconds = 30;
        REQUIRE(HasProblem(ValidateConfig(config), "max_backoff_seconds"));
    }

    SECTION("Missing account") {
        config.relayer.account.clear();
        REQUIRE(HasProblem(ValidateConfig(config), "relayer.account"));
    }

    SECTION("Source and destination must be different chains") {
        config.destination.chain_id = config.source.chain_id;
        REQUIRE(HasProblem(ValidateConfig(config), "must differ"));
    }
}
