// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <mutex>
#include <unistd.h>

namespace custody {
namespace util {

namespace {

std::mutex g_dir_locks_mutex;

// Held directory locks, keyed by full lock file path
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

std::string ErrnoReason() { return std::strerror(errno); }

} // namespace

FileLock::FileLock(const fs::path &file) {
  // O_CREAT avoids a separate create step (no TOCTOU window);
  // O_CLOEXEC keeps the lock out of child processes.
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = ErrnoReason();
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    // Closing the descriptor releases the fcntl lock
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = ErrnoReason();
    return false;
  }
  return true;
}

LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name, bool probe_only,
                         std::string *reason) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  const fs::path lockfile_path = directory / lockfile_name;
  const std::string key = lockfile_path.string();

  if (g_dir_locks.count(key) > 0) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->IsOpen()) {
    if (reason) *reason = file_lock->GetReason();
    if (!probe_only) {
      LOG_ERROR("Failed to open lock file {}: {}", key, file_lock->GetReason());
    }
    return LockResult::ErrorWrite;
  }

  if (!file_lock->TryLock()) {
    if (reason) *reason = file_lock->GetReason();
    if (!probe_only) {
      LOG_ERROR("Failed to lock directory {}: {}", directory.string(),
                file_lock->GetReason());
    }
    return LockResult::ErrorLock;
  }

  if (probe_only) {
    // Released when file_lock goes out of scope
    return LockResult::Success;
  }

  g_dir_locks.emplace(key, std::move(file_lock));
  LOG_TRACE("Acquired directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  if (g_dir_locks.erase((directory / lockfile_name).string()) > 0) {
    LOG_TRACE("Released directory lock: {}", directory.string());
  }
}

} // namespace util
} // namespace custody
