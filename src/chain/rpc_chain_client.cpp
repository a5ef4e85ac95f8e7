// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "chain/rpc_chain_client.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"

namespace bridgerelay {
namespace chain {

using json = nlohmann::json;

namespace {

std::optional<std::string> StringField(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

uint64_t ParseQuantityResult(const json &result, const std::string &method) {
  if (!result.is_string()) {
    throw TransientFetchError(method + " returned a non-string result");
  }
  auto value = util::ParseQuantity(result.get<std::string>());
  if (!value) {
    throw TransientFetchError(method + " returned a malformed quantity: " +
                              result.get<std::string>());
  }
  return *value;
}

} // anonymous namespace

std::optional<RawLog> DecodeLogEntry(const json &entry) {
  if (!entry.is_object()) {
    return std::nullopt;
  }

  RawLog log;

  auto address = StringField(entry, "address");
  if (!address) {
    return std::nullopt;
  }
  auto addr = Address::FromHex(*address);
  if (!addr) {
    return std::nullopt;
  }
  log.address = *addr;

  auto topics = entry.find("topics");
  if (topics == entry.end() || !topics->is_array()) {
    return std::nullopt;
  }
  for (const auto &t : *topics) {
    if (!t.is_string()) {
      return std::nullopt;
    }
    auto topic = uint256::FromHex(t.get<std::string>());
    if (!topic) {
      return std::nullopt;
    }
    log.topics.push_back(*topic);
  }

  auto data = StringField(entry, "data");
  if (!data) {
    return std::nullopt;
  }
  auto bytes = util::ParseHex(*data);
  if (!bytes) {
    return std::nullopt;
  }
  log.data = std::move(*bytes);

  if (auto bn = StringField(entry, "blockNumber")) {
    log.block_number = util::ParseQuantity(*bn);
  }
  if (auto tx = StringField(entry, "transactionHash")) {
    log.tx_hash = uint256::FromHex(*tx);
  }
  if (auto li = StringField(entry, "logIndex")) {
    auto index = util::ParseQuantity(*li);
    if (index && *index <= UINT32_MAX) {
      log.log_index = static_cast<uint32_t>(*index);
    }
  }
  auto removed = entry.find("removed");
  if (removed != entry.end() && removed->is_boolean()) {
    log.removed = removed->get<bool>();
  }

  return log;
}

RpcChainClient::RpcChainClient(std::string name,
                               std::unique_ptr<rpc::RpcTransport> transport,
                               MintCallConfig mint)
    : name_(std::move(name)), rpc_(std::move(transport)),
      mint_(std::move(mint)) {}

json RpcChainClient::FetchCall(const std::string &method, const json &params) {
  try {
    return rpc_.Call(method, params);
  } catch (const rpc::RpcTransportError &e) {
    throw TransientFetchError(name_ + ": " + method + ": " + e.what());
  } catch (const rpc::RpcError &e) {
    throw TransientFetchError(name_ + ": " + method + ": " + e.what());
  }
}

json RpcChainClient::SubmitCall(const std::string &method, const json &params) {
  try {
    return rpc_.Call(method, params);
  } catch (const rpc::RpcTransportError &e) {
    throw SubmissionError(name_ + ": " + method + ": " + e.what());
  } catch (const rpc::RpcError &e) {
    throw SubmissionError(name_ + ": " + method + ": " + e.what());
  }
}

uint64_t RpcChainClient::GetChainId() {
  return ParseQuantityResult(FetchCall("eth_chainId", json::array()),
                             "eth_chainId");
}

uint64_t RpcChainClient::GetTipHeight() {
  return ParseQuantityResult(FetchCall("eth_blockNumber", json::array()),
                             "eth_blockNumber");
}

std::vector<RawLog> RpcChainClient::GetLogs(uint64_t from_block,
                                            uint64_t to_block,
                                            const LogFilter &filter) {
  json query;
  query["fromBlock"] = util::ToQuantity(from_block);
  query["toBlock"] = util::ToQuantity(to_block);
  query["address"] = filter.contract.GetHex();
  query["topics"] = json::array({filter.event_topic.GetHex()});

  json result = FetchCall("eth_getLogs", json::array({query}));
  if (!result.is_array()) {
    throw TransientFetchError(name_ + ": eth_getLogs returned a non-array result");
  }

  std::vector<RawLog> logs;
  logs.reserve(result.size());
  size_t undecodable = 0;
  for (const auto &entry : result) {
    auto log = DecodeLogEntry(entry);
    if (!log) {
      ++undecodable;
      continue;
    }
    logs.push_back(std::move(*log));
  }

  if (undecodable > 0) {
    LOG_RPC_DEBUG("{}: dropped {} undecodable log entries in [{}, {}]", name_,
                  undecodable, from_block, to_block);
  }
  return logs;
}

SignedAction RpcChainClient::Sign(const RelayAction &action,
                                  const std::string &key) {
  json tx;
  tx["from"] = key;
  tx["to"] = mint_.bridge_contract.GetHex();
  tx["gas"] = util::ToQuantity(mint_.gas_limit);
  tx["value"] = "0x0";
  tx["data"] = util::HexStr(EncodeMintCall(mint_.mint_selector, action));
  tx["chainId"] = util::ToQuantity(action.destination_chain_id);

  json result = SubmitCall("eth_signTransaction", json::array({tx}));

  // geth returns {raw, tx}; other nodes return the raw hex string directly
  std::optional<std::string> raw;
  if (result.is_string()) {
    raw = result.get<std::string>();
  } else if (result.is_object()) {
    raw = StringField(result, "raw");
  }
  if (!raw) {
    throw SubmissionError(name_ + ": eth_signTransaction returned no raw transaction");
  }

  auto bytes = util::ParseHex(*raw);
  if (!bytes || bytes->empty()) {
    throw SubmissionError(name_ + ": eth_signTransaction returned malformed hex");
  }

  return SignedAction{action, std::move(*bytes)};
}

SubmissionHandle RpcChainClient::Submit(const SignedAction &signed_action) {
  json result = SubmitCall("eth_sendRawTransaction",
                           json::array({util::HexStr(signed_action.payload)}));
  if (!result.is_string()) {
    throw SubmissionError(name_ + ": eth_sendRawTransaction returned a non-string result");
  }
  return SubmissionHandle{result.get<std::string>()};
}

} // namespace chain
} // namespace bridgerelay
