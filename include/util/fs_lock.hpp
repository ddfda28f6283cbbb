// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace plebnet {
namespace util {

enum class LockResult {
  Success,     // Lock acquired
  ErrorWrite,  // Could not create the lock file
  ErrorLock,   // Held by another process
};

/**
 * Exclusive fcntl() lock on <directory>/<lockfile_name>, held until the
 * object is destroyed or Release() is called. Keeps two daemons from
 * sharing one datadir.
 */
class DirectoryLock {
public:
  DirectoryLock(const DirectoryLock&) = delete;
  DirectoryLock& operator=(const DirectoryLock&) = delete;

  DirectoryLock(std::filesystem::path directory, std::string lockfile_name = ".lock");
  ~DirectoryLock();

  LockResult Acquire();
  void Release();

  bool held() const { return held_; }
  const std::string& reason() const { return reason_; }

private:
  std::filesystem::path lockfile_;
  std::string reason_;
  int fd_{-1};
  bool held_{false};
};

}  // namespace util
}  // namespace plebnet
