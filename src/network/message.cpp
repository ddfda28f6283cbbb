// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "network/message.hpp"

#include "network/protocol.hpp"

#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace plebnet {
namespace message {

namespace {

json ContactToJson(const network::Contact& contact) {
  return {{"id", contact.id()}, {"address", {{"host", contact.host()}, {"port", contact.port()}}}};
}

std::optional<network::Contact> ContactFromJson(const json& data) {
  if (!data.is_object() || !data.contains("id") || !data.contains("address")) {
    return std::nullopt;
  }
  const json& id = data["id"];
  const json& address = data["address"];
  if (!id.is_string() || !address.is_object()) {
    return std::nullopt;
  }
  if (!address.contains("host") || !address.contains("port")) {
    return std::nullopt;
  }
  const json& host = address["host"];
  const json& port = address["port"];
  if (!host.is_string() || !port.is_number_integer()) {
    return std::nullopt;
  }
  auto port_value = port.get<int64_t>();
  if (port_value < 0 || port_value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  auto id_value = id.get<std::string>();
  if (id_value.empty()) {
    return std::nullopt;
  }
  return network::Contact(std::move(id_value), host.get<std::string>(), static_cast<uint16_t>(port_value));
}

}  // namespace

Envelope MakeAddContact(const network::Contact& contact) {
  // Strip liveness: the wire carries identity only.
  return AddContactMessage{network::Contact(contact.id(), contact.host(), contact.port())};
}

Envelope MakePing() {
  return PingMessage{};
}

std::string CommandOf(const Envelope& envelope) {
  if (std::holds_alternative<AddContactMessage>(envelope)) {
    return protocol::commands::ADD_CONTACT;
  }
  if (std::holds_alternative<PingMessage>(envelope)) {
    return protocol::commands::PING;
  }
  return std::get<UnknownMessage>(envelope).command;
}

std::string SerializeEnvelope(const Envelope& envelope) {
  json j;
  j["command"] = CommandOf(envelope);
  if (const auto* add = std::get_if<AddContactMessage>(&envelope)) {
    j["data"] = ContactToJson(add->contact);
  } else {
    j["data"] = nullptr;
  }
  return j.dump();
}

std::optional<Envelope> ParseEnvelope(const std::string& text) {
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  auto command_it = j.find("command");
  if (command_it == j.end() || !command_it->is_string()) {
    return std::nullopt;
  }
  const auto command = command_it->get<std::string>();

  if (command == protocol::commands::ADD_CONTACT) {
    auto data_it = j.find("data");
    if (data_it == j.end()) {
      return std::nullopt;
    }
    auto contact = ContactFromJson(*data_it);
    if (!contact) {
      return std::nullopt;
    }
    return Envelope{AddContactMessage{std::move(*contact)}};
  }
  if (command == protocol::commands::PING) {
    return Envelope{PingMessage{}};
  }
  return Envelope{UnknownMessage{command}};
}

std::vector<uint8_t> EncodeFrame(const Envelope& envelope) {
  const std::string payload = SerializeEnvelope(envelope);
  const auto len = static_cast<uint32_t>(payload.size());

  std::vector<uint8_t> frame;
  frame.reserve(protocol::FRAME_HEADER_SIZE + payload.size());
  frame.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
  frame.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
  frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
  frame.push_back(static_cast<uint8_t>(len & 0xFF));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

void FrameDecoder::Feed(const uint8_t* data, size_t size) {
  if (failed_) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<std::string> FrameDecoder::Next() {
  if (failed_ || buffer_.size() < protocol::FRAME_HEADER_SIZE) {
    return std::nullopt;
  }

  const uint32_t len = (static_cast<uint32_t>(buffer_[0]) << 24) | (static_cast<uint32_t>(buffer_[1]) << 16) |
                       (static_cast<uint32_t>(buffer_[2]) << 8) | static_cast<uint32_t>(buffer_[3]);
  if (len > protocol::MAX_MESSAGE_SIZE) {
    failed_ = true;
    buffer_.clear();
    return std::nullopt;
  }
  if (buffer_.size() < protocol::FRAME_HEADER_SIZE + len) {
    return std::nullopt;
  }

  auto begin = buffer_.begin() + protocol::FRAME_HEADER_SIZE;
  std::string payload(begin, begin + len);
  buffer_.erase(buffer_.begin(), begin + len);
  return payload;
}

}  // namespace message
}  // namespace plebnet
