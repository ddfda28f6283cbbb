// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license
// POSIX implementation (Linux/macOS only)

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace plebnet {
namespace util {

DirectoryLock::DirectoryLock(std::filesystem::path directory, std::string lockfile_name)
    : lockfile_(std::move(directory) / lockfile_name) {}

DirectoryLock::~DirectoryLock() {
  Release();
}

LockResult DirectoryLock::Acquire() {
  if (held_) {
    return LockResult::Success;
  }

  if (fd_ == -1) {
    // O_CLOEXEC: children must not inherit the lock
    fd_ = open(lockfile_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ == -1) {
      reason_ = std::strerror(errno);
      LOG_ERROR("Failed to open lock file {}: {}", lockfile_.string(), reason_);
      return LockResult::ErrorWrite;
    }
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;  // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to lock {}: {}", lockfile_.string(), reason_);
    return LockResult::ErrorLock;
  }

  held_ = true;
  LOG_TRACE("Acquired lock {}", lockfile_.string());
  return LockResult::Success;
}

void DirectoryLock::Release() {
  if (fd_ == -1) {
    return;
  }
  // Closing the descriptor drops the fcntl lock
  close(fd_);
  fd_ = -1;
  if (held_) {
    held_ = false;
    LOG_TRACE("Released lock {}", lockfile_.string());
  }
}

}  // namespace util
}  // namespace plebnet
