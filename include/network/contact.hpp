// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace plebnet {
namespace network {

// Endpoint a MessageSender can reach
struct ContactAddress {
  std::string host;
  uint16_t port{0};

  std::string ToString() const { return host + ":" + std::to_string(port); }

  bool operator==(const ContactAddress& other) const { return host == other.host && port == other.port; }
  bool operator!=(const ContactAddress& other) const { return !(*this == other); }
};

/**
 * Contact - one peer as seen by the local node
 *
 * Identity (id, address) is fixed at creation. Liveness is tracked by
 * first_failure: absent while the link is up, otherwise the unix time at
 * which the current unreachable streak started.
 *
 * Not thread-safe; AddressBook serializes access under its own mutex.
 */
class Contact {
public:
  Contact() = default;
  Contact(std::string id, std::string host, uint16_t port, std::optional<int64_t> first_failure = std::nullopt);

  const std::string& id() const { return id_; }
  const ContactAddress& address() const { return address_; }
  const std::string& host() const { return address_.host; }
  uint16_t port() const { return address_.port; }
  std::optional<int64_t> first_failure() const { return first_failure_; }

  // Starts a failure streak at the current time. No-op during a streak.
  void LinkDown();

  // Ends the failure streak. No-op while active.
  void LinkUp();

  bool IsActive() const { return !first_failure_.has_value(); }

  // Seconds since the streak started, 0 while active.
  int64_t InactiveFor(int64_t now) const;

  // Identity comparison; liveness is ignored.
  bool SameIdentity(const Contact& other) const { return id_ == other.id_ && address_ == other.address_; }

private:
  std::string id_;
  ContactAddress address_;
  std::optional<int64_t> first_failure_;
};

}  // namespace network
}  // namespace plebnet
