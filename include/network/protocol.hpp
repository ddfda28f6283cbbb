// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace plebnet {
namespace protocol {

// Envelope commands
namespace commands {
constexpr const char* ADD_CONTACT = "add-contact";
constexpr const char* PING = "ping";
}  // namespace commands

namespace ports {
constexpr uint16_t DEFAULT = 8001;
}  // namespace ports

// Frame = 4-byte big-endian payload length + JSON envelope
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr uint32_t MAX_MESSAGE_SIZE = 64 * 1024;

// Address book timing defaults
constexpr std::chrono::seconds DEFAULT_CONTACT_RESTORE_TIMEOUT{3600};
constexpr std::chrono::seconds DEFAULT_INACTIVE_PING_INTERVAL{1799};
constexpr std::chrono::seconds DEFAULT_RECEIVER_NOTIFY_INTERVAL{1};

// A delivery attempt (resolve + connect + write) must finish within this
constexpr std::chrono::seconds DEFAULT_SEND_TIMEOUT{5};

// Inbound connections that stay silent this long are closed
constexpr std::chrono::seconds INBOUND_IDLE_TIMEOUT{30};

// Per-receiver cap on queued, not yet delivered envelopes
constexpr size_t MAX_PENDING_MESSAGES = 10000;

}  // namespace protocol
}  // namespace plebnet
