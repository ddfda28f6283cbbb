// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#pragma once

/*
 AddressBook - local peer view with gossip propagation and failure detection

 Purpose
 - Hold the contacts this node knows about (never including itself)
 - Spread newly learned contacts to every other known contact ("add-contact")
 - Track per-contact liveness from the outcome of each delivery attempt
 - Periodically ping unreachable contacts and evict those that stay
   unreachable past the restore timeout

 Threading
 - The receiver calls Notify() from its own thread; the eviction worker
   runs on a dedicated thread; public methods may be called from any
   thread. contacts_ is guarded by contacts_mutex_.
 - Sends never happen under contacts_mutex_: targets are snapshotted, the
   lock is released, and liveness is written back by id afterwards.
*/

#include "network/contact.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace plebnet {
namespace network {

class AddressBook {
public:
  struct Config {
    std::chrono::seconds contact_restore_timeout;         // Max unreachable time before eviction
    std::chrono::milliseconds inactive_ping_interval;     // Eviction worker period
    std::chrono::milliseconds receiver_notify_interval;   // Passed through to the receiver

    Config()
        : contact_restore_timeout(protocol::DEFAULT_CONTACT_RESTORE_TIMEOUT),
          inactive_ping_interval(protocol::DEFAULT_INACTIVE_PING_INTERVAL),
          receiver_notify_interval(protocol::DEFAULT_RECEIVER_NOTIFY_INTERVAL) {}
  };

  // Copies contacts (dropping self and repeated ids), registers Notify() as
  // the receiver's consumer on self's port, and starts the eviction worker.
  // Throws std::invalid_argument on a null sender/receiver or empty self id,
  // std::runtime_error if the receiver cannot start.
  AddressBook(Contact self, const std::vector<Contact>& contacts, MessageSenderPtr sender,
              MessageReceiverPtr receiver, const Config& config = Config{});
  ~AddressBook();

  AddressBook(const AddressBook&) = delete;
  AddressBook& operator=(const AddressBook&) = delete;

  // Receiver consumer. add-contact is applied; ping and unknown commands
  // are ignored.
  void Notify(const message::Envelope& envelope);

  // Introduce a peer this node discovered itself and start the add-contact
  // epidemic. Replaces an entry with the same id.
  void CreateNewDistributedContact(const Contact& contact);

  // Deliver through the sender and record the outcome on the known contact
  // with recipient's id. Returns false on DeliveryError.
  bool SendMessageToContact(const Contact& recipient, const message::Envelope& envelope);

  // Stop the receiver, signal the eviction worker and join it. Idempotent.
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  const Contact& self() const { return self_; }
  const Config& config() const { return config_; }

  // Snapshot ordered by id
  std::vector<Contact> GetContacts() const;
  std::optional<Contact> GetContact(const std::string& id) const;
  bool HasContact(const std::string& id) const;
  size_t size() const;
  size_t inactive_count() const;

  // Persist the current view (including liveness) as JSON.
  bool SaveContacts(const std::string& filepath) const;

  // Empty vector when the file does not exist, nullopt when it is corrupt.
  static std::optional<std::vector<Contact>> LoadContacts(const std::string& filepath);

  // Test-only: run one probe/evict cycle on the calling thread
  // This method is intentionally public but should only be used in tests
  void test_hook_probe_inactive_contacts() { ProbeInactiveContacts(); }

private:
  void HandleAddContact(const Contact& contact);
  void ForwardContact(const Contact& contact, const std::vector<Contact>& targets);
  std::vector<Contact> ForwardTargetsLocked(const std::string& announced_id) const;
  void SetLinkState(const std::string& id, bool link_up);
  void ProbeInactiveContacts();
  void EvictionLoop();
  bool StopRequested();

  const Contact self_;
  const Config config_;
  MessageSenderPtr sender_;
  MessageReceiverPtr receiver_;

  mutable std::mutex contacts_mutex_;
  std::map<std::string, Contact> contacts_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};  // guarded by stop_mutex_
  std::atomic<bool> running_{false};
  std::thread eviction_thread_;
};

}  // namespace network
}  // namespace plebnet
