// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace plebnet {
namespace util {

// Virtually unique node id: hex SHA-256 of five random lowercase letters
// salted with parent_id, followed by the current unix time in decimal.
// A node spawned by another passes the parent's id as salt.
std::string GenerateContactId(const std::string& parent_id = "");

// Lowercase hex SHA-256 of data.
std::string Sha256Hex(const std::string& data);

}  // namespace util
}  // namespace plebnet
