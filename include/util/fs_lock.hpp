// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace custody {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive advisory lock on a file (fcntl F_SETLK)
 *
 * The lock is held until the object is destroyed. fcntl locks are
 * per-process, so a second FileLock on the same path inside this process
 * does not conflict; LockDirectory() keeps a registry for that case.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  explicit FileLock(const fs::path &file);
  ~FileLock();

  // Try to take the lock without blocking
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }

private:
  int fd_{-1};
  std::string reason_;
};

enum class LockResult {
  Success,    // Lock acquired (or already held by this process)
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock held by another process
};

/**
 * Lock a directory by creating and locking <directory>/<lockfile_name>
 *
 * Used for the node data directory and for each tenant store. Locks stay
 * registered until UnlockDirectory().
 *
 * @param probe_only Test whether the lock could be taken, without holding it
 * @param reason Receives the OS error text on failure (optional)
 */
LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name = ".lock",
                         bool probe_only = false,
                         std::string *reason = nullptr);

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name = ".lock");

} // namespace util
} // namespace custody
