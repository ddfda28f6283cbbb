// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license

#include "network/address_book.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace plebnet {
namespace network {

namespace {

constexpr int CONTACTS_FILE_VERSION = 1;

json SerializeContact(const Contact& contact) {
  json j = {{"id", contact.id()}, {"host", contact.host()}, {"port", contact.port()}};
  if (auto since = contact.first_failure()) {
    j["first_failure"] = *since;
  }
  return j;
}

std::optional<Contact> DeserializeContact(const json& j) {
  try {
    std::optional<int64_t> first_failure;
    if (j.contains("first_failure") && !j["first_failure"].is_null()) {
      first_failure = j["first_failure"].get<int64_t>();
    }
    auto id = j.at("id").get<std::string>();
    const auto port = j.at("port").get<int64_t>();
    if (id.empty() || port < 0 || port > 65535) {
      return std::nullopt;
    }
    return Contact(std::move(id), j.at("host").get<std::string>(), static_cast<uint16_t>(port), first_failure);
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

}  // namespace

AddressBook::AddressBook(Contact self, const std::vector<Contact>& contacts, MessageSenderPtr sender,
                         MessageReceiverPtr receiver, const Config& config)
    : self_(std::move(self)), config_(config), sender_(std::move(sender)), receiver_(std::move(receiver)) {
  if (!sender_ || !receiver_) {
    throw std::invalid_argument("AddressBook requires a message sender and receiver");
  }
  if (self_.id().empty()) {
    throw std::invalid_argument("AddressBook self contact must have an id");
  }

  for (const auto& contact : contacts) {
    if (contact.id() == self_.id()) {
      LOG_GOSSIP_DEBUG("ignoring self ({}) in initial contacts", contact.id());
      continue;
    }
    if (!contacts_.emplace(contact.id(), contact).second) {
      LOG_GOSSIP_DEBUG("ignoring repeated initial contact {}", contact.id());
    }
  }

  // Notify() may run on the receiver's thread once Start() returns
  const size_t initial_count = contacts_.size();

  if (!receiver_->Start(self_.port(), config_.receiver_notify_interval,
                        [this](const message::Envelope& envelope) { Notify(envelope); })) {
    throw std::runtime_error("AddressBook: receiver failed to start on port " + std::to_string(self_.port()));
  }

  try {
    eviction_thread_ = std::thread(&AddressBook::EvictionLoop, this);
  } catch (const std::system_error& e) {
    LOG_GOSSIP_ERROR("failed to start eviction worker: {}", e.what());
    receiver_->Stop();
    throw;
  }
  running_.store(true, std::memory_order_release);

  LOG_GOSSIP_INFO("address book for {} at {} started with {} contacts", self_.id(), self_.address().ToString(),
                  initial_count);
}

AddressBook::~AddressBook() {
  Stop();
}

void AddressBook::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // No Notify() calls after this returns
  receiver_->Stop();

  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
  if (eviction_thread_.joinable()) {
    eviction_thread_.join();
  }

  LOG_GOSSIP_INFO("address book for {} stopped", self_.id());
}

// ============================================================================
// Protocol
// ============================================================================

void AddressBook::Notify(const message::Envelope& envelope) {
  if (const auto* add = std::get_if<message::AddContactMessage>(&envelope)) {
    HandleAddContact(add->contact);
    return;
  }
  if (std::holds_alternative<message::PingMessage>(envelope)) {
    return;
  }
  LOG_GOSSIP_DEBUG_RL("ignoring unknown command '{}'", std::get<message::UnknownMessage>(envelope).command);
}

void AddressBook::HandleAddContact(const Contact& contact) {
  std::vector<Contact> targets;
  {
    std::lock_guard<std::mutex> lock(contacts_mutex_);
    if (contact.id() == self_.id()) {
      LOG_GOSSIP_TRACE("add-contact for self, ignoring");
      return;
    }
    if (!contacts_.emplace(contact.id(), contact).second) {
      LOG_GOSSIP_TRACE("add-contact for known contact {}, ignoring", contact.id());
      return;
    }
    targets = ForwardTargetsLocked(contact.id());
  }

  LOG_GOSSIP_INFO("learned contact {} at {}, forwarding to {} peers", contact.id(), contact.address().ToString(),
                  targets.size());
  ForwardContact(contact, targets);
}

void AddressBook::CreateNewDistributedContact(const Contact& contact) {
  std::vector<Contact> targets;
  {
    std::lock_guard<std::mutex> lock(contacts_mutex_);
    if (contact.id() == self_.id()) {
      LOG_GOSSIP_WARN("refusing to distribute own contact {}", contact.id());
      return;
    }
    contacts_.insert_or_assign(contact.id(), contact);
    targets = ForwardTargetsLocked(contact.id());
  }

  LOG_GOSSIP_INFO("distributing new contact {} at {} to {} peers", contact.id(), contact.address().ToString(),
                  targets.size());
  ForwardContact(contact, targets);
}

std::vector<Contact> AddressBook::ForwardTargetsLocked(const std::string& announced_id) const {
  std::vector<Contact> targets;
  targets.reserve(contacts_.size());
  for (const auto& [id, known] : contacts_) {
    if (id == announced_id || id == self_.id()) {
      continue;
    }
    targets.push_back(known);
  }
  return targets;
}

void AddressBook::ForwardContact(const Contact& contact, const std::vector<Contact>& targets) {
  const auto envelope = message::MakeAddContact(contact);
  for (const auto& target : targets) {
    SendMessageToContact(target, envelope);
  }
}

// ============================================================================
// Delivery and liveness
// ============================================================================

bool AddressBook::SendMessageToContact(const Contact& recipient, const message::Envelope& envelope) {
  if (recipient.id() == self_.id()) {
    LOG_GOSSIP_WARN("not sending '{}' to self", message::CommandOf(envelope));
    return false;
  }

  try {
    sender_->Send(recipient.address(), envelope);
  } catch (const DeliveryError& e) {
    LOG_GOSSIP_DEBUG("'{}' to {} failed: {}", message::CommandOf(envelope), recipient.id(), e.what());
    SetLinkState(recipient.id(), false);
    return false;
  }

  SetLinkState(recipient.id(), true);
  return true;
}

void AddressBook::SetLinkState(const std::string& id, bool link_up) {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  auto it = contacts_.find(id);
  if (it == contacts_.end()) {
    return;
  }

  Contact& contact = it->second;
  const bool was_active = contact.IsActive();
  if (link_up) {
    contact.LinkUp();
    if (!was_active) {
      LOG_GOSSIP_INFO("contact {} is reachable again", id);
    }
  } else {
    contact.LinkDown();
    if (was_active) {
      LOG_GOSSIP_INFO("contact {} unreachable since {}", id, util::FormatTime(*contact.first_failure()));
    }
  }
}

// ============================================================================
// Failure detection
// ============================================================================

void AddressBook::ProbeInactiveContacts() {
  std::vector<Contact> inactive;
  {
    std::lock_guard<std::mutex> lock(contacts_mutex_);
    for (const auto& [id, contact] : contacts_) {
      if (!contact.IsActive()) {
        inactive.push_back(contact);
      }
    }
  }
  if (inactive.empty()) {
    return;
  }

  LOG_GOSSIP_DEBUG("probing {} inactive contacts", inactive.size());
  const auto ping = message::MakePing();

  for (const auto& contact : inactive) {
    if (StopRequested()) {
      return;
    }
    if (SendMessageToContact(contact, ping)) {
      continue;
    }

    const int64_t now = util::GetTime();
    std::lock_guard<std::mutex> lock(contacts_mutex_);
    auto it = contacts_.find(contact.id());
    if (it == contacts_.end() || it->second.IsActive()) {
      continue;
    }
    const int64_t inactive_for = it->second.InactiveFor(now);
    if (inactive_for >= config_.contact_restore_timeout.count()) {
      contacts_.erase(it);
      LOG_GOSSIP_INFO("evicted contact {} after {}s unreachable", contact.id(), inactive_for);
    }
  }
}

bool AddressBook::StopRequested() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  return stop_requested_;
}

void AddressBook::EvictionLoop() {
  LOG_GOSSIP_DEBUG("eviction worker started (interval {}ms, restore timeout {}s)",
                   config_.inactive_ping_interval.count(), config_.contact_restore_timeout.count());

  while (true) {
    {
      std::unique_lock<std::mutex> lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, config_.inactive_ping_interval, [this]() { return stop_requested_; })) {
        break;
      }
    }

    try {
      ProbeInactiveContacts();
    } catch (const std::exception& e) {
      LOG_GOSSIP_ERROR("probe cycle failed: {}", e.what());
    }
  }

  LOG_GOSSIP_DEBUG("eviction worker exiting");
}

// ============================================================================
// Accessors
// ============================================================================

std::vector<Contact> AddressBook::GetContacts() const {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  std::vector<Contact> out;
  out.reserve(contacts_.size());
  for (const auto& [id, contact] : contacts_) {
    out.push_back(contact);
  }
  return out;
}

std::optional<Contact> AddressBook::GetContact(const std::string& id) const {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  auto it = contacts_.find(id);
  if (it == contacts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool AddressBook::HasContact(const std::string& id) const {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  return contacts_.count(id) > 0;
}

size_t AddressBook::size() const {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  return contacts_.size();
}

size_t AddressBook::inactive_count() const {
  std::lock_guard<std::mutex> lock(contacts_mutex_);
  size_t count = 0;
  for (const auto& [id, contact] : contacts_) {
    if (!contact.IsActive()) {
      ++count;
    }
  }
  return count;
}

// ============================================================================
// Persistence
// ============================================================================

bool AddressBook::SaveContacts(const std::string& filepath) const {
  json root;
  root["version"] = CONTACTS_FILE_VERSION;
  root["self"] = SerializeContact(self_);
  root["contacts"] = json::array();
  for (const auto& contact : GetContacts()) {
    root["contacts"].push_back(SerializeContact(contact));
  }

  if (!util::atomic_write_file(filepath, root.dump(2), 0600)) {
    LOG_GOSSIP_ERROR("failed to save contacts to {}", filepath);
    return false;
  }
  LOG_GOSSIP_DEBUG("saved {} contacts to {}", root["contacts"].size(), filepath);
  return true;
}

std::optional<std::vector<Contact>> AddressBook::LoadContacts(const std::string& filepath) {
  std::error_code ec;
  if (!std::filesystem::exists(filepath, ec)) {
    LOG_GOSSIP_DEBUG("no contacts file at {}", filepath);
    return std::vector<Contact>{};
  }

  auto text = util::read_file_string(filepath);
  if (!text) {
    LOG_GOSSIP_ERROR("cannot read contacts file {}", filepath);
    return std::nullopt;
  }

  json root = json::parse(*text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded() || !root.is_object()) {
    LOG_GOSSIP_ERROR("contacts file {} is not valid JSON", filepath);
    return std::nullopt;
  }
  auto version = root.find("version");
  if (version == root.end() || !version->is_number_integer() || version->get<int>() != CONTACTS_FILE_VERSION) {
    LOG_GOSSIP_ERROR("contacts file {} has unsupported version", filepath);
    return std::nullopt;
  }
  auto list = root.find("contacts");
  if (list == root.end() || !list->is_array()) {
    LOG_GOSSIP_ERROR("contacts file {} has no contacts array", filepath);
    return std::nullopt;
  }

  std::vector<Contact> contacts;
  for (const auto& entry : *list) {
    auto contact = DeserializeContact(entry);
    if (!contact) {
      LOG_GOSSIP_ERROR("contacts file {} has a malformed entry", filepath);
      return std::nullopt;
    }
    contacts.push_back(std::move(*contact));
  }

  LOG_GOSSIP_DEBUG("loaded {} contacts from {}", contacts.size(), filepath);
  return contacts;
}

}  // namespace network
}  // namespace plebnet
