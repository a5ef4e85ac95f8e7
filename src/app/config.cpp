// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "app/config.hpp"
#include "chain/abi.hpp"
#include "chain/uint.hpp"
#include "rpc/http_client.hpp"
#include "util/files.hpp"
#include "util/strencodings.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bridgerelay {
namespace app {

namespace {

template <typename T>
void ReadField(const json &section, const char *key, T &out) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

const json &Section(const json &root, const char *name) {
  static const json kEmpty = json::object();
  auto it = root.find(name);
  return it == root.end() ? kEmpty : *it;
}

void CheckUrl(const std::string &name, const std::string &url,
              std::vector<std::string> &problems) {
  if (url.empty()) {
    problems.push_back(name + " is not set");
  } else if (!rpc::HttpEndpoint::Parse(url)) {
    problems.push_back(name + " must be an http://host[:port][/path] URL, got '" +
                       url + "'");
  }
}

} // anonymous namespace

bool ParseStartBlock(const std::string &value, std::optional<uint64_t> &out) {
  if (value == "latest") {
    out.reset();
    return true;
  }
  auto number = util::ParseUInt64(value);
  if (!number) {
    return false;
  }
  out = *number;
  return true;
}

bool LoadConfigFile(const std::filesystem::path &path, RelayerConfig &config,
                    std::string &error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "config file " + path.string() + " does not exist";
    return false;
  }

  auto contents = util::read_file_string(path);
  if (!contents) {
    error = "config file " + path.string() + " cannot be read";
    return false;
  }

  json root;
  try {
    root = json::parse(*contents);
  } catch (const json::parse_error &e) {
    error = "config file " + path.string() + " is not valid JSON: " + e.what();
    return false;
  }
  if (!root.is_object()) {
    error = "config file " + path.string() + " must contain a JSON object";
    return false;
  }

  for (const char *name : {"source", "destination", "relayer"}) {
    auto it = root.find(name);
    if (it != root.end() && !it->is_object()) {
      error = "config file " + path.string() + ": \"" + name +
              "\" must be an object";
      return false;
    }
  }

  // Work on a copy so a half-applied file never leaks into the caller
  RelayerConfig next = config;
  try {
    const json &source = Section(root, "source");
    ReadField(source, "rpc_url", next.source.rpc_url);
    ReadField(source, "chain_id", next.source.chain_id);
    ReadField(source, "bridge_contract", next.source.bridge_contract);
    ReadField(source, "event_topic", next.source.event_topic);

    const json &dest = Section(root, "destination");
    ReadField(dest, "rpc_url", next.destination.rpc_url);
    ReadField(dest, "chain_id", next.destination.chain_id);
    ReadField(dest, "bridge_contract", next.destination.bridge_contract);
    ReadField(dest, "mint_selector", next.destination.mint_selector);
    ReadField(dest, "gas_limit", next.destination.gas_limit);

    const json &relayer = Section(root, "relayer");
    ReadField(relayer, "account", next.relayer.account);
    ReadField(relayer, "max_window_size", next.relayer.max_window_size);
    ReadField(relayer, "confirmation_lag", next.relayer.confirmation_lag);
    ReadField(relayer, "polling_interval_seconds",
              next.relayer.polling_interval_seconds);
    ReadField(relayer, "max_backoff_seconds", next.relayer.max_backoff_seconds);
    ReadField(relayer, "dedup_capacity", next.relayer.dedup_capacity);
    ReadField(relayer, "rpc_timeout_seconds", next.relayer.rpc_timeout_seconds);
    ReadField(relayer, "dry_run", next.relayer.dry_run);

    auto start = relayer.find("start_block");
    if (start != relayer.end()) {
      if (start->is_number_unsigned()) {
        next.relayer.start_block = start->get<uint64_t>();
      } else if (!start->is_string() ||
                 !ParseStartBlock(start->get<std::string>(),
                                  next.relayer.start_block)) {
        error = "relayer.start_block must be \"latest\" or a block number";
        return false;
      }
    }
  } catch (const json::exception &e) {
    error = "config file " + path.string() + ": " + e.what();
    return false;
  }

  config = std::move(next);
  return true;
}

std::optional<std::string> SystemEnvironment(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

void ApplyEnvironment(RelayerConfig &config, const EnvLookup &lookup) {
  if (auto url = lookup("SOURCE_CHAIN_RPC_URL")) {
    config.source.rpc_url = *url;
  }
  if (auto url = lookup("DESTINATION_CHAIN_RPC_URL")) {
    config.destination.rpc_url = *url;
  }
  if (auto account = lookup("RELAYER_ACCOUNT")) {
    config.relayer.account = *account;
  }
}

std::vector<std::string> ValidateConfig(const RelayerConfig &config) {
  std::vector<std::string> problems;

  CheckUrl("source.rpc_url", config.source.rpc_url, problems);
  CheckUrl("destination.rpc_url", config.destination.rpc_url, problems);

  if (!Address::FromHex(config.source.bridge_contract)) {
    problems.push_back("source.bridge_contract must be a 20-byte hex address");
  }
  if (!uint256::FromHex(config.source.event_topic)) {
    problems.push_back("source.event_topic must be a 32-byte hex hash");
  }
  if (!Address::FromHex(config.destination.bridge_contract)) {
    problems.push_back(
        "destination.bridge_contract must be a 20-byte hex address");
  }
  if (!chain::ParseSelector(config.destination.mint_selector)) {
    problems.push_back("destination.mint_selector must be 4 hex bytes");
  }
  if (config.destination.gas_limit == 0) {
    problems.push_back("destination.gas_limit must be positive");
  }

  if (config.relayer.account.empty()) {
    problems.push_back("relayer.account is not set");
  }
  if (config.relayer.max_window_size == 0) {
    problems.push_back("relayer.max_window_size must be positive");
  }
  if (config.relayer.polling_interval_seconds == 0) {
    problems.push_back("relayer.polling_interval_seconds must be positive");
  }
  if (config.relayer.max_backoff_seconds <
      config.relayer.polling_interval_seconds) {
    problems.push_back(
        "relayer.max_backoff_seconds must not be below the polling interval");
  }
  if (config.relayer.dedup_capacity == 0) {
    problems.push_back("relayer.dedup_capacity must be positive");
  }
  if (config.relayer.rpc_timeout_seconds == 0) {
    problems.push_back("relayer.rpc_timeout_seconds must be positive");
  }

  if (config.source.chain_id != 0 &&
      config.source.chain_id == config.destination.chain_id) {
    problems.push_back("source and destination chain ids must differ");
  }

  return problems;
}

} // namespace app
} // namespace bridgerelay
