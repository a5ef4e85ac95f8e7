// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_RELAY_CHECKPOINT_STORE_HPP
#define BRIDGERELAY_RELAY_CHECKPOINT_STORE_HPP

#include "chain/types.hpp"
#include "util/files.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace bridgerelay {
namespace relay {

// An idempotency key in the dedup set and the source block it came from
struct ProcessedId {
  chain::EventId id;
  uint64_t block_number{0};

  friend bool operator==(const ProcessedId &a, const ProcessedId &b) {
    return a.id == b.id && a.block_number == b.block_number;
  }
};

/**
 * Checkpoint - relay progress on one source chain
 *
 * processed_ids is ordered oldest-first (insertion order) and bounded by
 * the store's capacity. Entries from blocks above last_scanned_block are
 * never evicted: they are the only record of a partially relayed block.
 */
struct Checkpoint {
  uint64_t chain_id{0};
  uint64_t last_scanned_block{0};
  std::deque<ProcessedId> processed_ids;
};

/**
 * CheckpointStore - durable relay progress + bounded dedup set
 *
 * File format (JSON, replaced atomically on every commit):
 *   {"version": 1, "chain_id": 1, "last_scanned_block": 138,
 *    "processed_ids": [{"id": "1:0xabc...:0", "block": 131}, ...]}
 *
 * last_scanned_block never moves backwards through Commit(); Rewind() is
 * the explicit operator escape hatch for deep reorgs.
 *
 * Not thread-safe: the relay loop is the only user.
 */
class CheckpointStore {
public:
  static constexpr int CURRENT_VERSION = 1;
  static constexpr size_t DEFAULT_DEDUP_CAPACITY = 10000;

  // Replaces the checkpoint file; util::atomic_write_file unless injected
  using FileWriter = std::function<util::WriteResult(
      const std::filesystem::path &, const std::string &)>;

  CheckpointStore(std::filesystem::path path, uint64_t chain_id,
                  size_t dedup_capacity = DEFAULT_DEDUP_CAPACITY,
                  FileWriter writer = {});

  /**
   * Load the persisted checkpoint
   * @param genesis_last_block last_scanned_block of the zero checkpoint
   *        (scanning starts at genesis_last_block + 1). Only evaluated when
   *        there is no usable file.
   *
   * Missing, corrupt or unsupported file: zero checkpoint (the last two
   * also log a warning). Throws StorageError if the file exists but cannot
   * be read, or belongs to a different chain.
   */
  const Checkpoint &Load(const std::function<uint64_t()> &genesis_last_block);
  const Checkpoint &Load(uint64_t genesis_last_block = 0);

  /**
   * Persist new progress atomically (temp file + fsync + rename)
   *
   * Throws StorageError if the file was not replaced or if new_last_block
   * is lower than the current value; in both cases the in-memory state is
   * unchanged. A replaced file whose directory sync failed still counts
   * as committed.
   */
  void Commit(uint64_t new_last_block,
              const std::vector<ProcessedId> &newly_processed);

  /**
   * Move last_scanned_block to an arbitrary (usually lower) block,
   * keeping the dedup set. Used for manual recovery after a source reorg
   * deeper than the confirmation lag. Throws StorageError on I/O failure.
   */
  void Rewind(uint64_t last_block);

  bool Contains(const chain::EventId &id) const;

  const Checkpoint &Current() const { return checkpoint_; }
  uint64_t LastScannedBlock() const { return checkpoint_.last_scanned_block; }

  // True if Load() found a valid file or a commit has succeeded
  bool HasPersistedState() const { return persisted_; }

  const std::filesystem::path &Path() const { return path_; }

private:
  using IdSet = std::unordered_set<chain::EventId, chain::EventIdHasher>;

  // Append unless the id is already present
  static void Insert(Checkpoint &cp, IdSet &index, const ProcessedId &entry);
  // Drop oldest resolved entries until the set fits its capacity
  void Evict(Checkpoint &cp, IdSet &index) const;

  const Checkpoint &StartAtGenesis(const std::function<uint64_t()> &genesis);

  std::string Serialize(const Checkpoint &cp) const;
  void Persist(const Checkpoint &cp, IdSet index);

  std::filesystem::path path_;
  uint64_t chain_id_;
  size_t capacity_;
  FileWriter writer_;

  Checkpoint checkpoint_;
  IdSet index_;
  bool persisted_{false};
};

} // namespace relay
} // namespace bridgerelay

#endif // BRIDGERELAY_RELAY_CHECKPOINT_STORE_HPP
