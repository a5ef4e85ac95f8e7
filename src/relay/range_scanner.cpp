// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/range_scanner.hpp"
#include "chain/abi.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <limits>

namespace bridgerelay {
namespace relay {

RangeScanner::RangeScanner(chain::ChainClient &source, chain::LogFilter filter,
                           uint64_t source_chain_id,
                           uint64_t destination_chain_id)
    : source_(source), filter_(std::move(filter)),
      source_chain_id_(source_chain_id),
      destination_chain_id_(destination_chain_id) {}

std::optional<ScanWindow> RangeScanner::NextWindow(const Checkpoint &checkpoint,
                                                   uint64_t source_tip,
                                                   uint64_t max_window_size,
                                                   uint64_t confirmation_lag) {
  if (max_window_size == 0 || source_tip < confirmation_lag) {
    return std::nullopt;
  }
  if (checkpoint.last_scanned_block == std::numeric_limits<uint64_t>::max()) {
    return std::nullopt;
  }

  const uint64_t safe_tip = source_tip - confirmation_lag;
  const uint64_t from_block = checkpoint.last_scanned_block + 1;
  if (from_block > safe_tip) {
    return std::nullopt;
  }

  // from_block + max_window_size - 1, without overflowing
  uint64_t to_block = safe_tip;
  if (safe_tip - from_block >= max_window_size) {
    to_block = from_block + (max_window_size - 1);
  }
  return ScanWindow{from_block, to_block};
}

std::vector<chain::DomainEvent> RangeScanner::Scan(const ScanWindow &window) {
  LOG_SCAN_DEBUG("Scanning blocks {} for {}", window.ToString(),
                 filter_.contract.GetHex());

  auto logs = source_.GetLogs(window.from_block, window.to_block, filter_);
  auto events = Normalize(logs, window);

  if (!events.empty()) {
    LOG_SCAN_INFO("Found {} TokensLocked event(s) in blocks {}", events.size(),
                  window.ToString());
  }
  return events;
}

std::vector<chain::DomainEvent>
RangeScanner::Normalize(const std::vector<chain::RawLog> &logs,
                        const ScanWindow &window) const {
  std::vector<chain::DomainEvent> events;
  events.reserve(logs.size());
  size_t dropped = 0;

  for (const auto &log : logs) {
    if (log.removed || !log.block_number || !log.tx_hash || !log.log_index) {
      ++dropped;
      continue;
    }
    if (*log.block_number < window.from_block ||
        *log.block_number > window.to_block) {
      ++dropped;
      continue;
    }
    if (log.address != filter_.contract || log.topics.empty() ||
        log.topics[0] != filter_.event_topic) {
      ++dropped;
      continue;
    }

    auto decoded = chain::DecodeTokensLocked(log);
    if (!decoded) {
      ++dropped;
      continue;
    }

    // Lock destined for another chain
    auto dest = decoded->destination_chain_id.GetUint64();
    if (!dest || *dest != destination_chain_id_) {
      LOG_SCAN_TRACE("Ignoring lock in tx {} for destination chain {}",
                     log.tx_hash->GetHex(),
                     decoded->destination_chain_id.GetHex());
      ++dropped;
      continue;
    }

    chain::DomainEvent ev;
    ev.source_chain_id = source_chain_id_;
    ev.source_block_number = *log.block_number;
    ev.source_tx_hash = *log.tx_hash;
    ev.log_index = *log.log_index;
    ev.sender = decoded->sender;
    ev.recipient = decoded->recipient;
    ev.amount = decoded->amount;
    ev.asset_id = decoded->token;
    ev.destination_chain_id = *dest;
    events.push_back(ev);
  }

  std::sort(events.begin(), events.end(),
            [](const chain::DomainEvent &a, const chain::DomainEvent &b) {
              if (a.source_block_number != b.source_block_number)
                return a.source_block_number < b.source_block_number;
              if (a.log_index != b.log_index)
                return a.log_index < b.log_index;
              return a.source_tx_hash < b.source_tx_hash;
            });

  // Nodes behind load balancers occasionally return the same log twice
  events.erase(std::unique(events.begin(), events.end(),
                           [](const chain::DomainEvent &a,
                              const chain::DomainEvent &b) {
                             return a.Id() == b.Id();
                           }),
               events.end());

  if (dropped > 0) {
    LOG_SCAN_DEBUG("Dropped {} non-matching log entries in blocks {}", dropped,
                   window.ToString());
  }
  return events;
}

} // namespace relay
} // namespace bridgerelay
