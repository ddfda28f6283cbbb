// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include "network/contact.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace plebnet {
namespace message {

// "add-contact": announce a peer (id + address only, never liveness)
struct AddContactMessage {
  network::Contact contact;
};

// "ping": liveness probe, empty payload
struct PingMessage {};

// Any command this node does not understand. Kept so callers can log it.
struct UnknownMessage {
  std::string command;
};

using Envelope = std::variant<AddContactMessage, PingMessage, UnknownMessage>;

Envelope MakeAddContact(const network::Contact& contact);
Envelope MakePing();

std::string CommandOf(const Envelope& envelope);

// {"command": ..., "data": ...} as compact JSON text
std::string SerializeEnvelope(const Envelope& envelope);

// nullopt when the text is not JSON, has no string "command", or carries
// a malformed payload for a known command. Unknown commands parse into
// UnknownMessage.
std::optional<Envelope> ParseEnvelope(const std::string& text);

// Length-prefixed wire frame for stream transports.
std::vector<uint8_t> EncodeFrame(const Envelope& envelope);

/**
 * FrameDecoder - reassembles frames from arbitrary TCP read chunks
 *
 * Feed() appends bytes; Next() pops complete payloads in order. A length
 * header above protocol::MAX_MESSAGE_SIZE poisons the decoder: Next()
 * returns nothing more and failed() turns true, and the connection
 * should be dropped.
 */
class FrameDecoder {
public:
  void Feed(const uint8_t* data, size_t size);
  std::optional<std::string> Next();
  bool failed() const { return failed_; }
  size_t buffered() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
  bool failed_{false};
};

}  // namespace message
}  // namespace plebnet
