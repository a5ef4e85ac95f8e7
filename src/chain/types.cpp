// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "chain/types.hpp"
#include "util/strencodings.hpp"

#include <functional>

namespace bridgerelay {
namespace chain {

namespace {

void AppendUint64(std::vector<uint8_t> &out, uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void AppendUint32(std::vector<uint8_t> &out, uint32_t value) {
  for (int i = 3; i >= 0; --i) {
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

template <typename Blob> void AppendBlob(std::vector<uint8_t> &out, const Blob &b) {
  out.insert(out.end(), b.begin(), b.end());
}

} // anonymous namespace

std::string EventId::ToString() const {
  return std::to_string(source_chain_id) + ":" + tx_hash.GetHex() + ":" +
         std::to_string(log_index);
}

std::optional<EventId> EventId::FromString(const std::string &str) {
  auto first = str.find(':');
  if (first == std::string::npos) {
    return std::nullopt;
  }
  auto second = str.find(':', first + 1);
  if (second == std::string::npos) {
    return std::nullopt;
  }

  auto chain_id = util::ParseUInt64(std::string_view(str).substr(0, first));
  auto hash = uint256::FromHex(str.substr(first + 1, second - first - 1));
  auto index = util::ParseUInt64(std::string_view(str).substr(second + 1));
  if (!chain_id || !hash || !index || *index > UINT32_MAX) {
    return std::nullopt;
  }

  return EventId{*chain_id, *hash, static_cast<uint32_t>(*index)};
}

size_t EventIdHasher::operator()(const EventId &id) const noexcept {
  // tx hashes are uniformly distributed; the first 8 bytes suffice
  uint64_t h = 0;
  for (int i = 0; i < 8; ++i) {
    h = (h << 8) | id.tx_hash.data()[i];
  }
  h ^= std::hash<uint64_t>{}(id.source_chain_id) + 0x9e3779b97f4a7c15ULL +
       (h << 6) + (h >> 2);
  h ^= std::hash<uint32_t>{}(id.log_index) + 0x9e3779b97f4a7c15ULL +
       (h << 6) + (h >> 2);
  return static_cast<size_t>(h);
}

std::vector<uint8_t> RelayAction::Serialize() const {
  std::vector<uint8_t> out;
  out.reserve(8 + 20 + 32 + 20 + 8 + 32 + 4 + 8);
  AppendUint64(out, destination_chain_id);
  AppendBlob(out, recipient);
  AppendBlob(out, amount);
  AppendBlob(out, asset_id);
  AppendUint64(out, idempotency_key.source_chain_id);
  AppendBlob(out, idempotency_key.tx_hash);
  AppendUint32(out, idempotency_key.log_index);
  AppendUint64(out, nonce_hint);
  return out;
}

} // namespace chain
} // namespace bridgerelay
