// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/application.hpp"
#include "chain/abi.hpp"
#include "chain/dry_run_client.hpp"
#include "chain/rpc_chain_client.hpp"
#include "rpc/http_client.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <csignal>
#include <iostream> // Banner goes to stdout before the first cycle logs

namespace bridgerelay {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(RelayerConfig config) : config_(std::move(config)) {
  instance_ = this;
}

Application::Application(RelayerConfig config,
                         std::unique_ptr<chain::ChainClient> source,
                         std::unique_ptr<chain::ChainClient> destination)
    : config_(std::move(config)), source_(std::move(source)),
      destination_(std::move(destination)) {
  instance_ = this;
}

Application::~Application() {
  shutdown();
  if (instance_ == this) {
    instance_ = nullptr;
  }
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing BridgeRelay {}...", GetVersionString());

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  try {
    init_clients();
    check_connectivity();
    init_checkpoint();
    init_orchestrator();
  } catch (const StartupError &e) {
    LOG_APP_ERROR("Startup failed: {}", e.what());
    return false;
  } catch (const StorageError &e) {
    LOG_APP_ERROR("Checkpoint unusable: {}", e.what());
    return false;
  }

  std::cout << GetStartupBanner(source_chain_id_, destination_chain_id_,
                                config_.relayer.dry_run)
            << std::flush;

  initialized_ = true;
  LOG_APP_INFO("Initialization complete");
  return true;
}

int Application::run() {
  if (!initialized_) {
    LOG_APP_ERROR("Application::run() called before initialize()");
    return 1;
  }

  setup_signal_handlers();
  LOG_APP_INFO("Relaying chain {} -> chain {}. Press Ctrl+C to stop",
               source_chain_id_, destination_chain_id_);

  int exit_code = 0;
  try {
    orchestrator_->Run(token_);
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Relay loop terminated by unexpected error: {}", e.what());
    exit_code = 1;
  }

  shutdown();
  return exit_code;
}

void Application::shutdown() {
  if (!datadir_locked_) {
    return;
  }

  LOG_APP_INFO("Shutting down BridgeRelay...");

  if (store_) {
    LOG_APP_INFO("Checkpoint at block {} ({})", store_->LastScannedBlock(),
                 store_->Path().string());
  }

  LOG_APP_DEBUG("Releasing data directory lock...");
  util::UnlockDirectory(config_.datadir, RelayerConfig::LOCK_FILENAME);
  datadir_locked_ = false;

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}",
                  config_.datadir.string());
    return false;
  }

  // Lock the data directory so two relayers never share one checkpoint
  util::LockResult lock_result =
      util::LockDirectory(config_.datadir, RelayerConfig::LOCK_FILENAME);

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_APP_ERROR("Cannot write to data directory: {}",
                  config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                  "BridgeRelay is probably already running.",
                  config_.datadir.string());
    return false;
  }

  datadir_locked_ = true;
  LOG_APP_DEBUG("Successfully locked data directory");
  return true;
}

void Application::init_clients() {
  const auto timeout = std::chrono::seconds(config_.relayer.rpc_timeout_seconds);

  if (!source_) {
    auto endpoint = rpc::HttpEndpoint::Parse(config_.source.rpc_url);
    if (!endpoint) {
      throw StartupError("invalid source RPC URL: " + config_.source.rpc_url);
    }
    LOG_APP_INFO("Source chain RPC: {}", endpoint->ToString());
    source_ = std::make_unique<chain::RpcChainClient>(
        "source", std::make_unique<rpc::HttpClient>(*endpoint, timeout));
  }

  if (!destination_) {
    auto endpoint = rpc::HttpEndpoint::Parse(config_.destination.rpc_url);
    if (!endpoint) {
      throw StartupError("invalid destination RPC URL: " +
                         config_.destination.rpc_url);
    }
    auto contract = Address::FromHex(config_.destination.bridge_contract);
    auto selector = chain::ParseSelector(config_.destination.mint_selector);
    if (!contract || !selector) {
      throw StartupError("invalid destination bridge contract or selector");
    }

    chain::MintCallConfig mint;
    mint.bridge_contract = *contract;
    mint.mint_selector = *selector;
    mint.gas_limit = config_.destination.gas_limit;

    LOG_APP_INFO("Destination chain RPC: {}", endpoint->ToString());
    destination_ = std::make_unique<chain::RpcChainClient>(
        "destination", std::make_unique<rpc::HttpClient>(*endpoint, timeout),
        mint);
  }

  if (config_.relayer.dry_run) {
    LOG_APP_WARN("Dry-run mode: destination transactions will NOT be sent");
    destination_ =
        std::make_unique<chain::DryRunChainClient>(std::move(destination_));
  }
}

uint64_t Application::resolve_chain_id(chain::ChainClient &client,
                                       const char *name, uint64_t configured) {
  uint64_t reported = 0;
  try {
    reported = client.GetChainId();
  } catch (const RelayError &e) {
    throw StartupError(std::string("cannot reach ") + name +
                       " chain: " + e.what());
  }

  if (configured != 0 && configured != reported) {
    throw StartupError(std::string(name) + " node reports chain id " +
                       std::to_string(reported) + ", configured " +
                       std::to_string(configured));
  }

  LOG_APP_INFO("Connected to {} chain (chain id {})", name, reported);
  return reported;
}

void Application::check_connectivity() {
  source_chain_id_ =
      resolve_chain_id(*source_, "source", config_.source.chain_id);
  destination_chain_id_ = resolve_chain_id(*destination_, "destination",
                                           config_.destination.chain_id);

  if (source_chain_id_ == destination_chain_id_) {
    throw StartupError("source and destination are the same chain (" +
                       std::to_string(source_chain_id_) + ")");
  }
}

uint64_t Application::resolve_genesis_block() {
  if (config_.relayer.start_block) {
    // Checkpoint 0 already means "block 0 done", so 0 and 1 coincide
    uint64_t start = *config_.relayer.start_block;
    return start > 0 ? start - 1 : 0;
  }

  // "latest": skip history and relay only what confirms from now on
  uint64_t tip = 0;
  try {
    tip = source_->GetTipHeight();
  } catch (const RelayError &e) {
    throw StartupError(std::string("cannot fetch source tip: ") + e.what());
  }
  uint64_t lag = config_.relayer.confirmation_lag;
  return tip >= lag ? tip - lag : 0;
}

void Application::init_checkpoint() {
  auto path = config_.datadir / RelayerConfig::CHECKPOINT_FILENAME;
  store_ = std::make_unique<relay::CheckpointStore>(
      path, source_chain_id_, config_.relayer.dedup_capacity);

  // The genesis block (and the tip query behind "latest") is only needed
  // when there is no usable checkpoint
  store_->Load([this] { return resolve_genesis_block(); });

  if (config_.rescan_from) {
    uint64_t from = *config_.rescan_from;
    LOG_APP_WARN("Rescan requested from block {}", from);
    store_->Rewind(from > 0 ? from - 1 : 0);
  }

  LOG_APP_INFO("Scanning resumes after block {}", store_->LastScannedBlock());
}

void Application::init_orchestrator() {
  auto contract = Address::FromHex(config_.source.bridge_contract);
  auto topic = uint256::FromHex(config_.source.event_topic);
  if (!contract || !topic) {
    throw StartupError("invalid source bridge contract or event topic");
  }

  relay::RelayOptions options;
  options.filter.contract = *contract;
  options.filter.event_topic = *topic;
  options.source_chain_id = source_chain_id_;
  options.destination_chain_id = destination_chain_id_;
  options.signing_key = config_.relayer.account;
  options.max_window_size = config_.relayer.max_window_size;
  options.confirmation_lag = config_.relayer.confirmation_lag;
  options.polling_interval =
      std::chrono::seconds(config_.relayer.polling_interval_seconds);
  options.max_backoff = std::chrono::seconds(config_.relayer.max_backoff_seconds);

  orchestrator_ = std::make_unique<relay::RelayOrchestrator>(
      *source_, *destination_, *store_, std::move(options));
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int) {
  // Only async-signal-safe work here: set an atomic flag
  if (instance_) {
    instance_->token_.RequestFromSignal();
  }
}

} // namespace app
} // namespace bridgerelay
