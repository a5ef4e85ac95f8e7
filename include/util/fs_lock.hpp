// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_UTIL_FS_LOCK_HPP
#define BRIDGERELAY_UTIL_FS_LOCK_HPP

#include <filesystem>
#include <string>

namespace bridgerelay {
namespace util {

namespace fs = std::filesystem;

/**
 * FileLock - exclusive advisory lock on a file (fcntl F_SETLK)
 *
 * The file is created if missing. The lock is held for as long as the
 * object lives; the owner's pid is written into the file so a second
 * relayer can report who holds the data directory.
 */
class FileLock {
public:
  explicit FileLock(const fs::path &file);
  ~FileLock();

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  bool IsOpen() const { return fd_ != -1; }
  bool TryLock();

  // pid of the process holding a conflicting lock, -1 if unknown
  long HolderPid() const;

  const std::string &GetReason() const { return reason_; }

private:
  void RecordOwner();

  int fd_{-1};
  std::string reason_;
};

enum class LockResult {
  Success,
  ErrorWrite, // Could not create the lock file
  ErrorLock,  // Another process holds the lock
};

/**
 * Lock a data directory so only one relayer uses its checkpoint.
 * Locking a directory this process already holds succeeds.
 * @param check_only Test the lock and release it immediately
 */
LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name,
                         bool check_only = false);

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name);

void ReleaseAllDirectoryLocks();

} // namespace util
} // namespace bridgerelay

#endif // BRIDGERELAY_UTIL_FS_LOCK_HPP
