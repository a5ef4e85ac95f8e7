// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Unit tests for Application startup and shutdown with injected chains

#include <catch2/catch.hpp>
#include "app/application.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/mock_chain_client.hpp"
#include <chrono>
#include <filesystem>
#include <thread>

using namespace bridgerelay;
using namespace bridgerelay::app;
using bridgerelay::test::MakeLockLog;
using bridgerelay::test::MockChainClient;
using bridgerelay::test::TestTxHash;

namespace {

constexpr uint64_t SOURCE_CHAIN = 1;
constexpr uint64_t DEST_CHAIN = 137;

class ApplicationTestFixture {
public:
    std::filesystem::path test_dir;
    RelayerConfig config;

    // Ownership moves to the Application in MakeApp(); the raw pointers stay valid
    std::unique_ptr<MockChainClient> source_owner;
    std::unique_ptr<MockChainClient> destination_owner;
    MockChainClient* source;
    MockChainClient* destination;

    ApplicationTestFixture()
        : source_owner(std::make_unique<MockChainClient>(SOURCE_CHAIN)),
          destination_owner(std::make_unique<MockChainClient>(DEST_CHAIN)),
          source(source_owner.get()),
          destination(destination_owner.get()) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = std::filesystem::temp_directory_path() /
                   ("bridgerelay_app_test_" + std::to_string(now));
        std::filesystem::create_directories(test_dir);

        config.datadir = test_dir;
        config.source.chain_id = SOURCE_CHAIN;
        config.source.bridge_contract = test::TestBridgeContract().GetHex();
        config.source.event_topic = test::TestEventTopic().GetHex();
        config.destination.chain_id = DEST_CHAIN;
        config.relayer.account = "relayer-account";
        config.relayer.polling_interval_seconds = 1;
        config.relayer.start_block = 101;

        source->tip = 150;
    }

    ~ApplicationTestFixture() {
        util::ReleaseAllDirectoryLocks();
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::unique_ptr<Application> MakeApp() {
        return std::make_unique<Application>(config, std::move(source_owner),
                                             std::move(destination_owner));
    }

    std::filesystem::path CheckpointPath() const {
        return test_dir / RelayerConfig::CHECKPOINT_FILENAME;
    }
};

} // namespace

TEST_CASE("Application - Initialize", "[app][unit]") {
    ApplicationTestFixture fixture;

    SECTION("Successful startup") {
        auto app = fixture.MakeApp();
        REQUIRE(Application::instance() == app.get());
        REQUIRE(app->initialize());

        REQUIRE(app->source_chain_id() == SOURCE_CHAIN);
        REQUIRE(app->destination_chain_id() == DEST_CHAIN);
        REQUIRE(std::filesystem::exists(fixture.test_dir / RelayerConfig::LOCK_FILENAME));
        REQUIRE(app->orchestrator() != nullptr);
        REQUIRE(app->orchestrator()->Options().signing_key == "relayer-account");

        // start_block 101 means block 101 is the first one scanned
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 100);
        REQUIRE(app->checkpoint_store()->Path() == fixture.CheckpointPath());
    }

    SECTION("Chain ids of 0 accept what the nodes report") {
        fixture.config.source.chain_id = 0;
        fixture.config.destination.chain_id = 0;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->source_chain_id() == SOURCE_CHAIN);
        REQUIRE(app->destination_chain_id() == DEST_CHAIN);
    }

    SECTION("Start from the latest confirmed block") {
        fixture.config.relayer.start_block.reset();
        fixture.source->tip = 500;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 488);
    }

    SECTION("Start block 0 scans from block 1") {
        fixture.config.relayer.start_block = 0;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 0);
    }

    SECTION("Start block 1 scans from block 1") {
        fixture.config.relayer.start_block = 1;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 0);
    }
}

TEST_CASE("Application - Startup failures", "[app][unit]") {
    ApplicationTestFixture fixture;

    SECTION("Unreachable source") {
        fixture.source->fail_chain_id = true;
        auto app = fixture.MakeApp();
        REQUIRE_FALSE(app->initialize());
        REQUIRE(app->run() == 1);
    }

    SECTION("Unreachable destination") {
        fixture.destination->fail_chain_id = true;
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Node reports a different chain than configured") {
        fixture.config.destination.chain_id = 10;
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Source and destination are the same chain") {
        fixture.destination->chain_id = SOURCE_CHAIN;
        fixture.config.destination.chain_id = 0;
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Tip unavailable when starting from latest") {
        fixture.config.relayer.start_block.reset();
        fixture.source->fail_tip = true;
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Invalid event topic") {
        fixture.config.source.event_topic = "0x1234";
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Checkpoint belongs to another chain") {
        auto written = util::atomic_write_file(
            fixture.CheckpointPath(),
            std::string(R"({"version": 1, "chain_id": 5, "last_scanned_block": 900, "processed_ids": []})"));
        REQUIRE(written == util::WriteResult::Ok);
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Checkpoint exists but cannot be read") {
        std::filesystem::create_directories(fixture.CheckpointPath());
        fixture.config.relayer.start_block.reset();
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }

    SECTION("Data directory is a file") {
        auto file = fixture.test_dir / "not_a_dir";
        REQUIRE(util::atomic_write_file(file, std::string("x")) == util::WriteResult::Ok);
        fixture.config.datadir = file;
        REQUIRE_FALSE(fixture.MakeApp()->initialize());
    }
}

TEST_CASE("Application - Existing checkpoint and rescan", "[app][unit]") {
    ApplicationTestFixture fixture;
    const chain::EventId relayed{SOURCE_CHAIN, TestTxHash(1), 0};
    {
        relay::CheckpointStore previous(fixture.CheckpointPath(), SOURCE_CHAIN);
        previous.Load(0);
        previous.Commit(300, {relay::ProcessedId{relayed, 290}});
    }

    SECTION("Persisted checkpoint wins over start_block") {
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 300);
        REQUIRE(app->checkpoint_store()->Contains(relayed));
    }

    SECTION("Restart with \"latest\" does not need the source tip") {
        fixture.config.relayer.start_block.reset();
        fixture.source->fail_tip = true;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 300);
    }

    SECTION("Rescan rewinds but keeps relayed ids") {
        fixture.config.rescan_from = 250;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 249);
        REQUIRE(app->checkpoint_store()->Contains(relayed));

        relay::CheckpointStore reloaded(fixture.CheckpointPath(), SOURCE_CHAIN);
        REQUIRE(reloaded.Load().last_scanned_block == 249);
    }
}

TEST_CASE("Application - Run until shutdown", "[app][unit]") {
    ApplicationTestFixture fixture;
    for (uint32_t i = 0; i < 5; ++i) {
        fixture.source->logs.push_back(
            MakeLockLog(101 + i, TestTxHash(i + 1), 0, 100 + i, DEST_CHAIN));
    }

    SECTION("Shutdown requested after the last relay") {
        MockChainClient* destination = fixture.destination;
        destination->on_submit = [destination](const chain::SignedAction&) {
            if (destination->submitted.size() == 5) {
                Application::instance()->request_shutdown();
            }
        };

        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());
        REQUIRE(app->run() == 0);

        REQUIRE(destination->submitted.size() == 5);
        REQUIRE(destination->sign_keys.front() == "relayer-account");
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 138);

        relay::CheckpointStore reloaded(fixture.CheckpointPath(), SOURCE_CHAIN);
        reloaded.Load();
        REQUIRE(reloaded.LastScannedBlock() == 138);
        REQUIRE(reloaded.Current().processed_ids.size() == 5);
    }

    SECTION("Shutdown from another thread while idle") {
        fixture.source->logs.clear();
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());

        std::thread stopper([&app]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            app->request_shutdown();
        });
        auto start = std::chrono::steady_clock::now();
        int rc = app->run();
        stopper.join();

        REQUIRE(rc == 0);
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 138);
    }

    SECTION("Dry run never reaches the destination") {
        fixture.config.relayer.dry_run = true;
        MockChainClient* destination = fixture.destination;
        auto app = fixture.MakeApp();
        REQUIRE(app->initialize());

        std::thread stopper([&app]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            app->request_shutdown();
        });
        REQUIRE(app->run() == 0);
        stopper.join();

        // Actions are still built and signed, only the broadcast is skipped
        REQUIRE(destination->sign_keys.size() == 5);
        REQUIRE(destination->submit_calls == 0);
        REQUIRE(app->checkpoint_store()->LastScannedBlock() == 138);
        REQUIRE(app->checkpoint_store()->Current().processed_ids.size() == 5);
    }
}
