// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RELAY_RANGE_SCANNER_HPP
#define BRIDGERELAY_RELAY_RANGE_SCANNER_HPP

#include "chain/chain_client.hpp"
#include "chain/types.hpp"
#include "relay/checkpoint_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace relay {

/**
 * ScanWindow - inclusive block range [from_block, to_block]
 */
struct ScanWindow {
  uint64_t from_block{0};
  uint64_t to_block{0};

  uint64_t size() const { return to_block - from_block + 1; }
  std::string ToString() const {
    return "[" + std::to_string(from_block) + ", " + std::to_string(to_block) + "]";
  }

  friend bool operator==(const ScanWindow &a, const ScanWindow &b) {
    return a.from_block == b.from_block && a.to_block == b.to_block;
  }
};

/**
 * RangeScanner - windowing and log normalization for the source chain
 *
 * Scan() returns DomainEvents in ascending (block_number, log_index)
 * order whatever order the node returned logs in. Entries that are not
 * TokensLocked logs of the bridge contract for our destination chain, or
 * that are malformed, removed by a reorg, or outside the window, are
 * dropped. Transport failures (TransientFetchError) propagate.
 */
class RangeScanner {
public:
  RangeScanner(chain::ChainClient &source, chain::LogFilter filter,
               uint64_t source_chain_id, uint64_t destination_chain_id);

  /**
   * Next window to scan, or nullopt (no work available) when
   * last_scanned_block + 1 > source_tip - confirmation_lag.
   */
  static std::optional<ScanWindow> NextWindow(const Checkpoint &checkpoint,
                                              uint64_t source_tip,
                                              uint64_t max_window_size,
                                              uint64_t confirmation_lag);

  std::vector<chain::DomainEvent> Scan(const ScanWindow &window);

  /**
   * Validate, convert and sort raw logs for `window`
   */
  std::vector<chain::DomainEvent>
  Normalize(const std::vector<chain::RawLog> &logs,
            const ScanWindow &window) const;

private:
  chain::ChainClient &source_;
  chain::LogFilter filter_;
  uint64_t source_chain_id_;
  uint64_t destination_chain_id_;
};

} // namespace relay
} // namespace bridgerelay

#endif // BRIDGERELAY_RELAY_RANGE_SCANNER_HPP
