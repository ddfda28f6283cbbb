// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace plebnet {
namespace util {

// Write via temp file + fsync + rename so readers never see a torn file.
// The temp file is opened O_EXCL | O_NOFOLLOW with the given mode.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode = 0644);

// Whole file as a string, or nullopt if it cannot be opened or read.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

bool ensure_directory(const std::filesystem::path& dir);

// ~/.plebnet, or an empty path when HOME is unset.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace plebnet
