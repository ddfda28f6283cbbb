// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace plebnet {
namespace util {

namespace {

// Contact files are small; anything bigger is not ours.
constexpr std::uintmax_t MAX_READ_SIZE = 16 * 1024 * 1024;

bool fsync_directory(const std::filesystem::path& dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool ok = fsync(fd) == 0;
  close(fd);
  return ok;
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  return buf;
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + temp_suffix();
  std::error_code ec;

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create {}: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {}", temp_path.string(), written,
                data.size(), std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    LOG_ERROR("atomic_write_file: fsync {} failed: {}", temp_path.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  if (!parent.empty() && !fsync_directory(parent)) {
    LOG_WARN("atomic_write_file: fsync of directory {} failed", parent.string());
  }
  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }
  if (size > MAX_READ_SIZE) {
    LOG_ERROR("read_file_string: {} is {} bytes, refusing to read", path.string(), size);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    LOG_ERROR("read_file_string: failed reading {}", path.string());
    return std::nullopt;
  }
  return contents.str();
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (!home) {
    LOG_ERROR("get_default_datadir: HOME is not set, use --datadir");
    return {};
  }
  return std::filesystem::path(home) / ".plebnet";
}

}  // namespace util
}  // namespace plebnet
