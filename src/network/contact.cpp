// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "network/contact.hpp"

#include "util/time.hpp"

#include <utility>

namespace plebnet {
namespace network {

Contact::Contact(std::string id, std::string host, uint16_t port, std::optional<int64_t> first_failure)
    : id_(std::move(id)), address_{std::move(host), port}, first_failure_(first_failure) {}

void Contact::LinkDown() {
  if (!first_failure_) {
    first_failure_ = util::GetTime();
  }
}

void Contact::LinkUp() {
  first_failure_.reset();
}

int64_t Contact::InactiveFor(int64_t now) const {
  if (!first_failure_ || now < *first_failure_) {
    return 0;
  }
  return now - *first_failure_;
}

}  // namespace network
}  // namespace plebnet
