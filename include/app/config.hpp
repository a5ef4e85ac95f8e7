// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_APP_CONFIG_HPP
#define BRIDGERELAY_APP_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace app {

struct SourceChainConfig {
  std::string rpc_url;
  uint64_t chain_id{0}; // 0 = accept whatever the node reports
  std::string bridge_contract;
  // topic0 of TokensLocked(address,address,address,uint256,uint256)
  std::string event_topic;
};

struct DestinationChainConfig {
  std::string rpc_url;
  uint64_t chain_id{0};
  std::string bridge_contract;
  std::string mint_selector; // 4-byte selector, hex
  uint64_t gas_limit{200000};
};

struct RelayerSettings {
  std::string account; // Signing key handle passed to the destination signer
  uint64_t max_window_size{100};
  uint64_t confirmation_lag{12};
  uint64_t polling_interval_seconds{30};
  uint64_t max_backoff_seconds{300};
  uint64_t dedup_capacity{10000};
  // First block to scan; nullopt = "latest". 0 acts as 1 (genesis has no logs)
  std::optional<uint64_t> start_block;
  uint64_t rpc_timeout_seconds{15};
  bool dry_run{false};
};

/**
 * RelayerConfig - everything the daemon needs to start
 *
 * Filled in precedence order: built-in defaults, JSON config file,
 * environment, command line.
 */
struct RelayerConfig {
  SourceChainConfig source;
  DestinationChainConfig destination;
  RelayerSettings relayer;

  std::filesystem::path datadir;
  std::optional<std::filesystem::path> conf_file;
  std::optional<uint64_t> rescan_from;

  static constexpr const char *CHECKPOINT_FILENAME = "checkpoint.json";
  static constexpr const char *DEFAULT_CONF_FILENAME = "relayer.json";
  static constexpr const char *LOG_FILENAME = "relayer.log";
  static constexpr const char *LOCK_FILENAME = ".lock";
};

/**
 * Parse a start block setting: "latest" (nullopt) or a decimal block number.
 * Returns false if neither.
 */
bool ParseStartBlock(const std::string &value, std::optional<uint64_t> &out);

/**
 * Load a JSON config file on top of `config`.
 *
 * {
 *   "source":      {"rpc_url", "chain_id", "bridge_contract", "event_topic"},
 *   "destination": {"rpc_url", "chain_id", "bridge_contract",
 *                   "mint_selector", "gas_limit"},
 *   "relayer":     {"account", "max_window_size", "confirmation_lag",
 *                   "polling_interval_seconds", "max_backoff_seconds",
 *                   "dedup_capacity", "start_block", "rpc_timeout_seconds",
 *                   "dry_run"}
 * }
 *
 * Every key is optional; absent keys keep their current value.
 * @return false (with `error` set) if the file is unreadable or malformed
 */
bool LoadConfigFile(const std::filesystem::path &path, RelayerConfig &config,
                    std::string &error);

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads the process environment
std::optional<std::string> SystemEnvironment(const std::string &name);

/**
 * Apply SOURCE_CHAIN_RPC_URL, DESTINATION_CHAIN_RPC_URL and RELAYER_ACCOUNT
 */
void ApplyEnvironment(RelayerConfig &config,
                      const EnvLookup &lookup = SystemEnvironment);

/**
 * Check a fully assembled config.
 * @return one human-readable message per problem; empty when valid
 */
std::vector<std::string> ValidateConfig(const RelayerConfig &config);

} // namespace app
} // namespace bridgerelay

#endif // BRIDGERELAY_APP_CONFIG_HPP
