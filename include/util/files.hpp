// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_UTIL_FILES_HPP
#define BRIDGERELAY_UTIL_FILES_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bridgerelay {
namespace util {

enum class WriteResult {
  Ok,
  NotDurable, // Renamed into place, but the directory fsync failed
  Failed,     // Nothing replaced; <path> keeps its previous contents
};

/**
 * Durable file helpers used for the checkpoint.
 *
 * atomic_write_file() writes <path>.tmp.<random>, fsyncs it, renames it over
 * <path> and fsyncs the parent directory. A reader sees either the previous
 * contents or the new contents in full.
 */
WriteResult atomic_write_file(const std::filesystem::path &path,
                              const std::vector<uint8_t> &data);
WriteResult atomic_write_file(const std::filesystem::path &path,
                              const std::string &data);

// Whole-file reads; nullopt if `path` is not a readable regular file
std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path &path);
std::optional<std::string> read_file_string(const std::filesystem::path &path);

// create_directories(); true if `dir` exists as a directory afterwards
bool ensure_directory(const std::filesystem::path &dir);

// $HOME/.bridgerelay (falls back to ./.bridgerelay without HOME)
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace bridgerelay

#endif // BRIDGERELAY_UTIL_FILES_HPP
