// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "chain/abi.hpp"
#include "util/strencodings.hpp"

#include <algorithm>

namespace bridgerelay {
namespace chain {

namespace {

constexpr size_t WORD_SIZE = 32;
constexpr size_t ADDRESS_OFFSET = WORD_SIZE - 20;

void AppendWord(std::vector<uint8_t> &out, const uint256 &word) {
  out.insert(out.end(), word.begin(), word.end());
}

} // anonymous namespace

std::optional<Address> AddressFromWord(const uint256 &word) {
  const uint8_t *p = word.data();
  if (std::any_of(p, p + ADDRESS_OFFSET, [](uint8_t b) { return b != 0; })) {
    return std::nullopt;
  }
  return Address(Address::FromBytes(p + ADDRESS_OFFSET));
}

uint256 WordFromAddress(const Address &address) {
  uint256 word;
  std::copy(address.begin(), address.end(), word.begin() + ADDRESS_OFFSET);
  return word;
}

std::optional<TokensLocked> DecodeTokensLocked(const RawLog &log) {
  if (log.topics.size() != 4 || log.data.size() != 2 * WORD_SIZE) {
    return std::nullopt;
  }

  auto token = AddressFromWord(log.topics[1]);
  auto sender = AddressFromWord(log.topics[2]);
  auto recipient = AddressFromWord(log.topics[3]);
  if (!token || !sender || !recipient) {
    return std::nullopt;
  }

  TokensLocked decoded;
  decoded.token = *token;
  decoded.sender = *sender;
  decoded.recipient = *recipient;
  decoded.amount = uint256::FromBytes(log.data.data());
  decoded.destination_chain_id = uint256::FromBytes(log.data.data() + WORD_SIZE);
  return decoded;
}

std::vector<uint8_t> EncodeMintCall(const FunctionSelector &selector,
                                    const RelayAction &action) {
  std::vector<uint8_t> out(selector.begin(), selector.end());
  out.reserve(selector.size() + 6 * WORD_SIZE);
  AppendWord(out, WordFromAddress(action.asset_id));
  AppendWord(out, WordFromAddress(action.recipient));
  AppendWord(out, action.amount);
  AppendWord(out, uint256::FromUint64(action.idempotency_key.source_chain_id));
  AppendWord(out, action.idempotency_key.tx_hash);
  AppendWord(out, uint256::FromUint64(action.idempotency_key.log_index));
  return out;
}

std::optional<FunctionSelector> ParseSelector(std::string_view hex) {
  auto bytes = util::ParseHex(hex);
  if (!bytes || bytes->size() != 4) {
    return std::nullopt;
  }
  FunctionSelector selector;
  std::copy(bytes->begin(), bytes->end(), selector.begin());
  return selector;
}

} // namespace chain
} // namespace bridgerelay
