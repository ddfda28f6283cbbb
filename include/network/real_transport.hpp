// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <asio.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/steady_timer.hpp>

namespace plebnet {
namespace network {

// TcpMessageSender - one short-lived TCP connection per envelope
//
// Resolve, connect and write run on a private io_context bounded by
// send_timeout; the call never blocks longer than that. Any network
// failure or timeout surfaces as DeliveryError.
class TcpMessageSender : public MessageSender {
public:
  explicit TcpMessageSender(std::chrono::milliseconds send_timeout = protocol::DEFAULT_SEND_TIMEOUT);

  void Send(const ContactAddress& address, const message::Envelope& envelope) override;

private:
  std::chrono::milliseconds send_timeout_;
};

// TcpMessageReceiver - accepts framed envelopes on a TCP port
//
// Owns an io_context and the single thread that runs it; all socket work,
// the notify timer and consumer calls happen on that thread. Parsed
// envelopes queue up and are handed to the consumer every notify
// interval (immediately when the interval is zero).
//
// Stop() must not be called from inside the consumer.
class TcpMessageReceiver : public MessageReceiver {
public:
  TcpMessageReceiver();
  ~TcpMessageReceiver() override;

  TcpMessageReceiver(const TcpMessageReceiver&) = delete;
  TcpMessageReceiver& operator=(const TcpMessageReceiver&) = delete;

  bool Start(uint16_t port, std::chrono::milliseconds notify_interval, Consumer consumer) override;
  void Stop() override;
  bool IsRunning() const override { return running_.load(std::memory_order_acquire); }

  // Bound port (resolves port 0), 0 when not listening
  uint16_t listening_port() const { return listening_port_.load(std::memory_order_acquire); }

  // Envelopes received but not yet handed to the consumer
  size_t pending_count() const;

private:
  class Session;

  void start_accept();
  void schedule_notify();
  void enqueue(message::Envelope envelope);
  void deliver_pending();
  void forget_session(const std::shared_ptr<Session>& session);

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> notify_timer_;
  std::thread io_thread_;

  std::mutex start_stop_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> listening_port_{0};
  std::chrono::milliseconds notify_interval_{0};
  Consumer consumer_;

  // Accessed only on the io thread
  std::set<std::shared_ptr<Session>> sessions_;

  mutable std::mutex pending_mutex_;
  std::deque<message::Envelope> pending_;
};

}  // namespace network
}  // namespace plebnet
