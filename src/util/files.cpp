// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace bridgerelay {
namespace util {

namespace {

// Sync directory to ensure rename is durable
bool sync_directory(const std::filesystem::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = ::fsync(fd) == 0;
  ::close(fd);
  return result;
}

// Generate random suffix for temp file
std::string random_suffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // anonymous namespace

WriteResult atomic_write_file(const std::filesystem::path &path,
                              const std::vector<uint8_t> &data) {
  // Create parent directory if needed
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return WriteResult::Failed;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return WriteResult::Failed;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      ::close(fd);
      remove_quietly(temp_path);
      return WriteResult::Failed;
    }
    total += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    ::close(fd);
    remove_quietly(temp_path);
    return WriteResult::Failed;
  }
  if (::close(fd) != 0) {
    remove_quietly(temp_path);
    return WriteResult::Failed;
  }

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    remove_quietly(temp_path);
    return WriteResult::Failed;
  }

  // Make the rename itself durable
  if (!sync_directory(parent.empty() ? std::filesystem::path(".") : parent)) {
    return WriteResult::NotDurable;
  }

  return WriteResult::Ok;
}

WriteResult atomic_write_file(const std::filesystem::path &path,
                              const std::string &data) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec);
}

std::optional<std::vector<uint8_t>>
read_file(const std::filesystem::path &path) {
  // Directories and devices would report a bogus size below
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  auto size = file.tellg();
  if (size < 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char *>(data.data()), size);

  if (!file) {
    return std::nullopt;
  }

  return data;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  auto data = read_file(path);
  if (!data) {
    return std::nullopt;
  }
  return std::string(data->begin(), data->end());
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".bridgerelay";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".bridgerelay";
}

} // namespace util
} // namespace bridgerelay
