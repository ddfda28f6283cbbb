// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

/*
 Transport collaborators consumed by AddressBook

 - MessageSender: delivers one envelope to one address. Throws
   DeliveryError when the recipient cannot be reached; any other exception
   is a programming error and propagates.
 - MessageReceiver: listens on a local port and hands each inbound
   envelope to a single registered consumer, batching deliveries at the
   notify interval.

 TcpMessageSender / TcpMessageReceiver (real_transport.hpp) implement both
 over asio.
*/

#include "network/contact.hpp"
#include "network/message.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace plebnet {
namespace network {

// The recipient could not be reached (resolve, connect, write or timeout).
class DeliveryError : public std::runtime_error {
public:
  explicit DeliveryError(const std::string& what) : std::runtime_error(what) {}
};

class MessageSender {
public:
  virtual ~MessageSender() = default;

  // Blocks until the envelope is handed to the recipient or fails.
  // Must fail fast rather than hang.
  virtual void Send(const ContactAddress& address, const message::Envelope& envelope) = 0;
};

class MessageReceiver {
public:
  using Consumer = std::function<void(const message::Envelope&)>;

  virtual ~MessageReceiver() = default;

  // Bind to port and start delivering to consumer. Returns false if the
  // receiver is already running or the port cannot be bound.
  virtual bool Start(uint16_t port, std::chrono::milliseconds notify_interval, Consumer consumer) = 0;

  // Stop listening and wait until no consumer call is in flight. Idempotent.
  virtual void Stop() = 0;

  virtual bool IsRunning() const = 0;
};

using MessageSenderPtr = std::shared_ptr<MessageSender>;
using MessageReceiverPtr = std::shared_ptr<MessageReceiver>;

}  // namespace network
}  // namespace plebnet
