// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/checkpoint_store.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

namespace bridgerelay {
namespace relay {

CheckpointStore::CheckpointStore(std::filesystem::path path, uint64_t chain_id,
                                 size_t dedup_capacity, FileWriter writer)
    : path_(std::move(path)), chain_id_(chain_id),
      capacity_(dedup_capacity == 0 ? 1 : dedup_capacity),
      writer_(std::move(writer)) {
  if (!writer_) {
    writer_ = [](const std::filesystem::path &p, const std::string &data) {
      return util::atomic_write_file(p, data);
    };
  }
  checkpoint_.chain_id = chain_id_;
}

void CheckpointStore::Insert(Checkpoint &cp, IdSet &index,
                             const ProcessedId &entry) {
  if (index.insert(entry.id).second) {
    cp.processed_ids.push_back(entry);
  }
}

void CheckpointStore::Evict(Checkpoint &cp, IdSet &index) const {
  auto it = cp.processed_ids.begin();
  while (cp.processed_ids.size() > capacity_ && it != cp.processed_ids.end()) {
    // Pinned until its block is fully resolved
    if (it->block_number > cp.last_scanned_block) {
      ++it;
      continue;
    }
    index.erase(it->id);
    it = cp.processed_ids.erase(it);
  }
}

const Checkpoint &
CheckpointStore::StartAtGenesis(const std::function<uint64_t()> &genesis) {
  checkpoint_.last_scanned_block = genesis();
  LOG_CKPT_INFO("Starting after block {}", checkpoint_.last_scanned_block);
  return checkpoint_;
}

const Checkpoint &CheckpointStore::Load(uint64_t genesis_last_block) {
  return Load([genesis_last_block] { return genesis_last_block; });
}

const Checkpoint &
CheckpointStore::Load(const std::function<uint64_t()> &genesis_last_block) {
  checkpoint_ = Checkpoint{};
  checkpoint_.chain_id = chain_id_;
  index_.clear();
  persisted_ = false;

  std::error_code ec;
  bool exists = std::filesystem::exists(path_, ec);
  if (ec) {
    throw StorageError("cannot access checkpoint " + path_.string() + ": " +
                       ec.message());
  }
  if (!exists) {
    LOG_CKPT_INFO("No checkpoint at {}", path_.string());
    return StartAtGenesis(genesis_last_block);
  }

  // An existing file we cannot read is not the same as no progress
  auto contents = util::read_file_string(path_);
  if (!contents) {
    throw StorageError("cannot read checkpoint " + path_.string());
  }

  json j;
  try {
    j = json::parse(*contents);
  } catch (const json::parse_error &e) {
    LOG_CKPT_WARN("Checkpoint {} is corrupt ({})", path_.string(), e.what());
    return StartAtGenesis(genesis_last_block);
  }

  Checkpoint loaded;
  IdSet index;
  size_t bad_ids = 0;
  try {
    int version = j.at("version").get<int>();
    if (version != CURRENT_VERSION) {
      LOG_CKPT_WARN("Checkpoint {} has unsupported version {}", path_.string(),
                    version);
      return StartAtGenesis(genesis_last_block);
    }

    loaded.chain_id = j.at("chain_id").get<uint64_t>();
    loaded.last_scanned_block = j.at("last_scanned_block").get<uint64_t>();

    for (const auto &entry : j.at("processed_ids")) {
      auto id_it = entry.is_object() ? entry.find("id") : entry.end();
      auto block_it = entry.is_object() ? entry.find("block") : entry.end();
      std::optional<chain::EventId> id;
      if (id_it != entry.end() && id_it->is_string() &&
          block_it != entry.end() && block_it->is_number_unsigned()) {
        id = chain::EventId::FromString(id_it->get<std::string>());
      }
      if (!id) {
        ++bad_ids;
        continue;
      }
      Insert(loaded, index, ProcessedId{*id, block_it->get<uint64_t>()});
    }
  } catch (const json::exception &e) {
    LOG_CKPT_WARN("Checkpoint {} is malformed ({})", path_.string(), e.what());
    return StartAtGenesis(genesis_last_block);
  }

  if (loaded.chain_id != chain_id_) {
    throw StorageError("checkpoint " + path_.string() + " belongs to chain " +
                       std::to_string(loaded.chain_id) + ", relayer is on chain " +
                       std::to_string(chain_id_));
  }

  if (bad_ids > 0) {
    LOG_CKPT_WARN("Checkpoint {}: ignored {} malformed processed ids",
                  path_.string(), bad_ids);
  }

  Evict(loaded, index);
  checkpoint_ = std::move(loaded);
  index_ = std::move(index);
  persisted_ = true;

  LOG_CKPT_INFO("Loaded checkpoint: chain {} last scanned block {} ({} "
                "processed ids)",
                checkpoint_.chain_id, checkpoint_.last_scanned_block,
                checkpoint_.processed_ids.size());
  return checkpoint_;
}

std::string CheckpointStore::Serialize(const Checkpoint &cp) const {
  json j;
  j["version"] = CURRENT_VERSION;
  j["chain_id"] = cp.chain_id;
  j["last_scanned_block"] = cp.last_scanned_block;
  json ids = json::array();
  for (const auto &entry : cp.processed_ids) {
    json item;
    item["id"] = entry.id.ToString();
    item["block"] = entry.block_number;
    ids.push_back(std::move(item));
  }
  j["processed_ids"] = std::move(ids);
  return j.dump(2);
}

void CheckpointStore::Persist(const Checkpoint &cp, IdSet index) {
  switch (writer_(path_, Serialize(cp))) {
  case util::WriteResult::Failed:
    LOG_CKPT_ERROR("Failed to write checkpoint {}", path_.string());
    throw StorageError("failed to write checkpoint " + path_.string());
  case util::WriteResult::NotDurable:
    // The new file is in place; memory must follow it
    LOG_CKPT_WARN("Checkpoint {} replaced but its directory could not be "
                  "synced",
                  path_.string());
    break;
  case util::WriteResult::Ok:
    break;
  }

  checkpoint_ = cp;
  index_ = std::move(index);
  persisted_ = true;
}

void CheckpointStore::Commit(uint64_t new_last_block,
                             const std::vector<ProcessedId> &newly_processed) {
  if (new_last_block < checkpoint_.last_scanned_block) {
    throw StorageError("refusing to move checkpoint back from block " +
                       std::to_string(checkpoint_.last_scanned_block) + " to " +
                       std::to_string(new_last_block));
  }

  Checkpoint next = checkpoint_;
  IdSet index = index_;
  next.last_scanned_block = new_last_block;
  for (const auto &entry : newly_processed) {
    Insert(next, index, entry);
  }
  Evict(next, index);

  Persist(next, std::move(index));

  LOG_CKPT_DEBUG("Committed checkpoint: last scanned block {} (+{} ids, {} "
                 "tracked)",
                 new_last_block, newly_processed.size(),
                 checkpoint_.processed_ids.size());
}

void CheckpointStore::Rewind(uint64_t last_block) {
  Checkpoint next = checkpoint_;
  next.last_scanned_block = last_block;

  Persist(next, index_);

  LOG_CKPT_WARN("Checkpoint rewound to block {} ({} processed ids kept)",
                last_block, checkpoint_.processed_ids.size());
}

bool CheckpointStore::Contains(const chain::EventId &id) const {
  return index_.count(id) > 0;
}

} // namespace relay
} // namespace bridgerelay
