// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace bridgerelay {
namespace util {

namespace {

// Locks held by this process, keyed by lock file path. fcntl locks are
// per-process, so a second FileLock on the same file would "succeed" and
// then drop the first one when closed; the registry prevents that.
std::mutex g_locks_mutex;
std::map<std::string, std::unique_ptr<FileLock>> g_locks;

struct flock WholeFileLock(short type) {
  struct flock fl;
  std::memset(&fl, 0, sizeof(fl));
  fl.l_type = type;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;
  return fl;
}

} // anonymous namespace

FileLock::FileLock(const fs::path &file) {
  fd_ = ::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    ::close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock fl = WholeFileLock(F_WRLCK);
  if (::fcntl(fd_, F_SETLK, &fl) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }

  RecordOwner();
  return true;
}

long FileLock::HolderPid() const {
  if (fd_ == -1) {
    return -1;
  }
  struct flock fl = WholeFileLock(F_WRLCK);
  if (::fcntl(fd_, F_GETLK, &fl) == -1 || fl.l_type == F_UNLCK) {
    return -1;
  }
  return static_cast<long>(fl.l_pid);
}

void FileLock::RecordOwner() {
  // Informational only; a failure here does not affect the lock
  const std::string pid = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd_, 0) != 0 ||
      ::pwrite(fd_, pid.data(), pid.size(), 0) !=
          static_cast<ssize_t>(pid.size())) {
    LOG_DEBUG("Could not record pid in lock file: {}", std::strerror(errno));
  }
}

LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name, bool check_only) {
  const fs::path lockfile = directory / lockfile_name;
  const std::string key = lockfile.string();

  std::lock_guard<std::mutex> guard(g_locks_mutex);
  if (g_locks.count(key) > 0) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile);
  if (!file_lock->IsOpen()) {
    LOG_ERROR("Cannot create lock file {}: {}", key, file_lock->GetReason());
    return LockResult::ErrorWrite;
  }

  if (!file_lock->TryLock()) {
    long holder = file_lock->HolderPid();
    if (holder > 0) {
      LOG_ERROR("Data directory {} is locked by process {}", directory.string(),
                holder);
    } else {
      LOG_ERROR("Cannot lock data directory {}: {}", directory.string(),
                file_lock->GetReason());
    }
    return LockResult::ErrorLock;
  }

  if (!check_only) {
    g_locks.emplace(key, std::move(file_lock));
  }
  return LockResult::Success;
}

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> guard(g_locks_mutex);
  g_locks.erase((directory / lockfile_name).string());
}

void ReleaseAllDirectoryLocks() {
  std::lock_guard<std::mutex> guard(g_locks_mutex);
  g_locks.clear();
}

} // namespace util
} // namespace bridgerelay
