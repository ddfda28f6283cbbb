// Copyright (c) 2025 The Plebnet developers
// TCP transport implementation using asio

#include "network/real_transport.hpp"

#include "util/logging.hpp"

#include <array>
#include <future>
#include <stdexcept>
#include <utility>

namespace plebnet {
namespace network {

// ============================================================================
// TcpMessageSender
// ============================================================================

TcpMessageSender::TcpMessageSender(std::chrono::milliseconds send_timeout) : send_timeout_(send_timeout) {}

void TcpMessageSender::Send(const ContactAddress& address, const message::Envelope& envelope) {
  auto frame = message::EncodeFrame(envelope);
  if (frame.size() > protocol::FRAME_HEADER_SIZE + protocol::MAX_MESSAGE_SIZE) {
    throw std::length_error("envelope exceeds MAX_MESSAGE_SIZE");
  }

  asio::io_context io;
  asio::ip::tcp::resolver resolver(io);
  asio::ip::tcp::socket socket(io);

  bool finished = false;
  asio::error_code result;

  auto on_write = [&](const asio::error_code& ec, size_t /*bytes*/) {
    finished = true;
    result = ec;
  };

  auto on_connect = [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
    if (ec) {
      finished = true;
      result = ec;
      return;
    }
    asio::async_write(socket, asio::buffer(frame), on_write);
  };

  auto on_resolve = [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      finished = true;
      result = ec;
      return;
    }
    asio::async_connect(socket, results, on_connect);
  };

  resolver.async_resolve(address.host, std::to_string(address.port), on_resolve);
  io.run_for(send_timeout_);

  if (!finished) {
    // Deadline hit: abort outstanding work and let the aborted handlers
    // run so nothing refers to this frame after we return.
    asio::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io.restart();
    io.run();
    LOG_NET_TRACE("send to {} timed out after {}ms", address.ToString(), send_timeout_.count());
    throw DeliveryError("timed out delivering to " + address.ToString());
  }

  if (result) {
    LOG_NET_TRACE("send to {} failed: {}", address.ToString(), result.message());
    throw DeliveryError("cannot deliver to " + address.ToString() + ": " + result.message());
  }

  asio::error_code ignored;
  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
}

// ============================================================================
// TcpMessageReceiver::Session
// ============================================================================

// One inbound connection. Lives on the receiver's io thread only.
class TcpMessageReceiver::Session : public std::enable_shared_from_this<TcpMessageReceiver::Session> {
public:
  Session(TcpMessageReceiver& owner, asio::ip::tcp::socket socket)
      : owner_(owner), socket_(std::move(socket)), idle_timer_(owner.io_context_) {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
  }

  void start() {
    arm_idle_timer();
    read();
  }

  void close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    asio::error_code ignored;
    idle_timer_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

private:
  void arm_idle_timer() {
    idle_timer_.expires_after(protocol::INBOUND_IDLE_TIMEOUT);
    idle_timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || self->closed_) {
        return;
      }
      LOG_NET_DEBUG("closing idle inbound connection from {}", self->remote_);
      self->finish();
    });
  }

  void read() {
    socket_.async_read_some(asio::buffer(buffer_),
                            [self = shared_from_this()](const asio::error_code& ec, size_t bytes) {
                              self->on_read(ec, bytes);
                            });
  }

  void on_read(const asio::error_code& ec, size_t bytes) {
    if (closed_) {
      return;
    }

    if (bytes > 0) {
      decoder_.Feed(buffer_.data(), bytes);
      while (auto payload = decoder_.Next()) {
        auto envelope = message::ParseEnvelope(*payload);
        if (!envelope) {
          LOG_NET_WARN_RL("dropping malformed envelope from {} ({} bytes)", remote_, payload->size());
          continue;
        }
        owner_.enqueue(std::move(*envelope));
      }
      if (decoder_.failed()) {
        LOG_NET_WARN_RL("oversized frame from {}, closing connection", remote_);
        finish();
        return;
      }
    }

    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        LOG_NET_TRACE("read error from {}: {}", remote_, ec.message());
      }
      if (decoder_.buffered() > 0) {
        LOG_NET_TRACE("{} closed with {} bytes of partial frame", remote_, decoder_.buffered());
      }
      finish();
      return;
    }

    arm_idle_timer();
    read();
  }

  void finish() {
    close();
    owner_.forget_session(shared_from_this());
  }

  TcpMessageReceiver& owner_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer idle_timer_;
  std::array<uint8_t, 4096> buffer_{};
  message::FrameDecoder decoder_;
  std::string remote_;
  bool closed_{false};
};

// ============================================================================
// TcpMessageReceiver
// ============================================================================

TcpMessageReceiver::TcpMessageReceiver() = default;

TcpMessageReceiver::~TcpMessageReceiver() {
  Stop();
}

bool TcpMessageReceiver::Start(uint16_t port, std::chrono::milliseconds notify_interval, Consumer consumer) {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    LOG_NET_TRACE("receiver already running");
    return false;
  }
  if (!consumer) {
    throw std::invalid_argument("TcpMessageReceiver::Start requires a consumer");
  }

  consumer_ = std::move(consumer);
  notify_interval_ = notify_interval;
  io_context_.restart();

  try {
    using tcp = asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Dual-stack first, IPv4-only when v6 is unavailable
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    } catch (const std::exception&) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    }

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_.store(ec ? 0 : ep.port(), std::memory_order_release);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    consumer_ = {};
    return false;
  }

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  notify_timer_ = std::make_unique<asio::steady_timer>(io_context_);

  running_.store(true, std::memory_order_release);
  start_accept();
  if (notify_interval_.count() > 0) {
    schedule_notify();
  }
  io_thread_ = std::thread([this]() { io_context_.run(); });

  LOG_NET_INFO("listening on port {}", listening_port());
  return true;
}

void TcpMessageReceiver::Stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // Tear down sockets on the io thread, then stop the loop.
  std::promise<void> closed;
  auto closed_future = closed.get_future();
  asio::post(io_context_, [this, &closed]() {
    asio::error_code ec;
    if (acceptor_) {
      acceptor_->close(ec);
    }
    if (notify_timer_) {
      notify_timer_->cancel();
    }
    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (const auto& session : sessions) {
      session->close();
    }
    closed.set_value();
  });
  closed_future.wait();

  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  acceptor_.reset();
  notify_timer_.reset();
  consumer_ = {};
  listening_port_.store(0, std::memory_order_release);

  {
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    if (!pending_.empty()) {
      LOG_NET_DEBUG("receiver stopped with {} undelivered envelopes", pending_.size());
    }
    pending_.clear();
  }
  LOG_NET_DEBUG("receiver stopped");
}

size_t TcpMessageReceiver::pending_count() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

void TcpMessageReceiver::start_accept() {
  if (!acceptor_) {
    return;
  }
  acceptor_->async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec == asio::error::operation_aborted || !IsRunning()) {
        return;
      }
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
      return;
    }

    auto session = std::make_shared<Session>(*this, std::move(socket));
    sessions_.insert(session);
    session->start();
    start_accept();
  });
}

void TcpMessageReceiver::forget_session(const std::shared_ptr<Session>& session) {
  sessions_.erase(session);
}

void TcpMessageReceiver::enqueue(message::Envelope envelope) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_.size() >= protocol::MAX_PENDING_MESSAGES) {
      LOG_NET_WARN_RL("receive queue full ({} envelopes), dropping {}", pending_.size(),
                      message::CommandOf(envelope));
      return;
    }
    pending_.push_back(std::move(envelope));
  }

  if (notify_interval_.count() == 0) {
    deliver_pending();
  }
}

void TcpMessageReceiver::schedule_notify() {
  notify_timer_->expires_after(notify_interval_);
  notify_timer_->async_wait([this](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || !IsRunning()) {
      return;
    }
    deliver_pending();
    schedule_notify();
  });
}

void TcpMessageReceiver::deliver_pending() {
  std::deque<message::Envelope> batch;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    batch.swap(pending_);
  }

  for (const auto& envelope : batch) {
    try {
      consumer_(envelope);
    } catch (const std::exception& e) {
      LOG_NET_ERROR("consumer threw on '{}' envelope: {}", message::CommandOf(envelope), e.what());
    }
  }
}

}  // namespace network
}  // namespace plebnet
