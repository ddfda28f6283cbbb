// Copyright (c) 2025 The Plebnet developers
// Distributed under the MIT software license
// AddressBook protocol tests over the in-memory SimulatedNetwork

#include <catch2/catch_test_macros.hpp>

#include "infra/simulated_network.hpp"
#include "network/address_book.hpp"
#include "network/protocol.hpp"
#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace plebnet::network;
using namespace plebnet::message;
using plebnet::test::Inbox;
using plebnet::test::SimulatedNetwork;
using plebnet::util::MockTimeScope;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kPort = 8001;

// Worker effectively parked; tests drive probe cycles through the test hook.
AddressBook::Config ManualConfig(std::chrono::seconds restore_timeout = 3600s) {
    AddressBook::Config config;
    config.contact_restore_timeout = restore_timeout;
    config.inactive_ping_interval = std::chrono::hours(24);
    config.receiver_notify_interval = 0ms;
    return config;
}

Contact Peer(const std::string& id, int n) {
    return Contact(id, "10.0.0." + std::to_string(n), kPort);
}

std::unique_ptr<AddressBook> MakeBook(SimulatedNetwork& net, const Contact& self, const std::vector<Contact>& contacts,
                                      const AddressBook::Config& config = ManualConfig()) {
    return std::make_unique<AddressBook>(self, contacts, net.CreateSender(), net.CreateReceiver(self.host()), config);
}

std::vector<std::string> Ids(const std::vector<Contact>& contacts) {
    std::vector<std::string> ids;
    for (const auto& c : contacts) {
        ids.push_back(c.id());
    }
    return ids;
}

class ExplodingSender : public MessageSender {
public:
    void Send(const ContactAddress&, const Envelope&) override { throw std::logic_error("bad envelope"); }
};

// Starts pushing add-contacts from its own thread the moment Start() returns
class EagerReceiver : public MessageReceiver {
public:
    explicit EagerReceiver(int burst) : burst_(burst) {}
    ~EagerReceiver() override { Stop(); }

    bool Start(uint16_t, std::chrono::milliseconds, Consumer consumer) override {
        if (worker_.joinable()) {
            return false;
        }
        running_ = true;
        worker_ = std::thread([this, consumer = std::move(consumer)]() {
            for (int i = 0; i < burst_; ++i) {
                consumer(MakeAddContact(Contact("early-" + std::to_string(i), "10.9.0.1", kPort)));
            }
        });
        return true;
    }

    void Stop() override {
        if (worker_.joinable()) {
            worker_.join();
        }
        running_ = false;
    }

    bool IsRunning() const override { return running_; }

private:
    int burst_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace

TEST_CASE("AddressBook: construction", "[address_book][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);

    SECTION("Self and repeated ids are dropped from the initial set") {
        auto book = MakeBook(net, self, {self, Peer("b", 2), Contact("b", "10.0.0.99", kPort), Peer("c", 3)});
        CHECK(book->size() == 2);
        CHECK_FALSE(book->HasContact("self"));
        REQUIRE(book->GetContact("b"));
        CHECK(book->GetContact("b")->host() == "10.0.0.2");
    }

    SECTION("Contacts are iterated in id order") {
        auto book = MakeBook(net, self, {Peer("zeta", 2), Peer("alpha", 3), Peer("mu", 4)});
        CHECK(Ids(book->GetContacts()) == std::vector<std::string>{"alpha", "mu", "zeta"});
    }

    SECTION("Registers as the receiver's consumer on self's port") {
        auto receiver = net.CreateReceiver(self.host());
        auto config = ManualConfig();
        config.receiver_notify_interval = 250ms;
        AddressBook book(self, {}, net.CreateSender(), receiver, config);

        CHECK(book.IsRunning());
        CHECK(receiver->IsRunning());
        CHECK(receiver->start_count() == 1);
        CHECK(receiver->notify_interval() == 250ms);

        // Reachable at self's address through the network
        net.CreateSender()->Send(self.address(), MakeAddContact(Peer("x", 8)));
        CHECK(book.HasContact("x"));
    }

    SECTION("Default config values") {
        AddressBook::Config config;
        CHECK(config.contact_restore_timeout == 3600s);
        CHECK(config.inactive_ping_interval == 1799s);
        CHECK(config.receiver_notify_interval == 1s);
    }

    SECTION("Null collaborators are rejected") {
        CHECK_THROWS_AS(AddressBook(self, {}, nullptr, net.CreateReceiver(self.host())), std::invalid_argument);
        CHECK_THROWS_AS(AddressBook(self, {}, net.CreateSender(), nullptr), std::invalid_argument);
    }

    SECTION("Receiver that cannot bind fails construction") {
        auto first = MakeBook(net, self, {});
        CHECK_THROWS_AS(MakeBook(net, Contact("other", self.host(), self.port()), {}), std::runtime_error);
    }
}

TEST_CASE("AddressBook: Stop is idempotent and releases the receiver", "[address_book][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    auto receiver = net.CreateReceiver(self.host());
    AddressBook book(self, {Peer("b", 2)}, net.CreateSender(), receiver, ManualConfig());

    const auto start = std::chrono::steady_clock::now();
    book.Stop();
    // Worker sleeps for 24h; Stop must wake it
    CHECK(std::chrono::steady_clock::now() - start < 5s);

    CHECK_FALSE(book.IsRunning());
    CHECK_FALSE(receiver->IsRunning());
    book.Stop();
    book.Stop();

    // Nothing listens on self's address any more
    CHECK_THROWS_AS(net.CreateSender()->Send(self.address(), MakePing()), DeliveryError);
}

TEST_CASE("AddressBook: add-contact is inserted and forwarded", "[address_book][gossip][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox a(net, "10.0.0.2", kPort);
    Inbox b(net, "10.0.0.3", kPort);
    Inbox p_inbox(net, "10.0.0.4", kPort);
    const Contact p = Peer("p", 4);

    auto book = MakeBook(net, self, {Peer("a", 2), Peer("b", 3)});
    book->Notify(MakeAddContact(p));

    SECTION("The new contact joins the view") {
        CHECK(book->size() == 3);
        REQUIRE(book->GetContact("p"));
        CHECK(book->GetContact("p")->address() == p.address());
        CHECK(book->GetContact("p")->IsActive());
    }

    SECTION("Exactly the other known contacts receive the forward") {
        CHECK(a.announced_ids() == std::vector<std::string>{"p"});
        CHECK(b.announced_ids() == std::vector<std::string>{"p"});
        CHECK(p_inbox.received().empty());
        CHECK(net.sends_to(self.address()) == 0);
        CHECK(net.send_count() == 2);
    }

    SECTION("Repeated add-contact changes nothing and forwards nothing") {
        net.ClearSends();
        book->Notify(MakeAddContact(p));
        book->Notify(MakeAddContact(Contact("p", "10.0.0.44", 9999)));
        CHECK(book->size() == 3);
        CHECK(book->GetContact("p")->host() == "10.0.0.4");
        CHECK(net.send_count() == 0);
        CHECK(a.announced_ids().size() == 1);
    }
}

TEST_CASE("AddressBook: add-contact for self is ignored", "[address_book][gossip][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox a(net, "10.0.0.2", kPort);
    auto book = MakeBook(net, self, {Peer("a", 2)});

    book->Notify(MakeAddContact(self));
    book->Notify(MakeAddContact(Contact("self", "192.168.1.1", 1234)));

    CHECK_FALSE(book->HasContact("self"));
    CHECK(book->size() == 1);
    CHECK(net.send_count() == 0);
}

TEST_CASE("AddressBook: forwarded payload carries identity only", "[address_book][gossip][unit]") {
    MockTimeScope mock_time(1'000'000);
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox a(net, "10.0.0.2", kPort);
    auto book = MakeBook(net, self, {Peer("a", 2)});

    book->CreateNewDistributedContact(Contact("q", "10.0.0.5", kPort, 999'000));

    auto received = a.received();
    REQUIRE(received.size() == 1);
    const auto* add = std::get_if<AddContactMessage>(&received[0]);
    REQUIRE(add);
    CHECK(add->contact.id() == "q");
    CHECK(add->contact.IsActive());
}

TEST_CASE("AddressBook: CreateNewDistributedContact", "[address_book][gossip][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox b(net, "10.0.0.2", kPort);
    Inbox c(net, "10.0.0.3", kPort);
    auto book = MakeBook(net, self, {Peer("b", 2), Peer("c", 3)});

    SECTION("New contact is inserted and announced to the others") {
        Inbox d(net, "10.0.0.4", kPort);
        book->CreateNewDistributedContact(Peer("d", 4));
        CHECK(book->HasContact("d"));
        CHECK(b.announced_ids() == std::vector<std::string>{"d"});
        CHECK(c.announced_ids() == std::vector<std::string>{"d"});
        CHECK(d.received().empty());
    }

    SECTION("Same id replaces the existing entry and is still announced") {
        book->CreateNewDistributedContact(Contact("b", "10.0.0.22", 9000));
        CHECK(book->size() == 2);
        CHECK(book->GetContact("b")->host() == "10.0.0.22");
        CHECK(book->GetContact("b")->port() == 9000);
        CHECK(c.announced_ids() == std::vector<std::string>{"b"});
        CHECK(b.received().empty());
    }

    SECTION("Own contact is never added") {
        book->CreateNewDistributedContact(self);
        CHECK_FALSE(book->HasContact("self"));
        CHECK(net.send_count() == 0);
    }

    SECTION("An unreachable target does not stop the burst") {
        net.SetUnreachable(b.address());
        book->CreateNewDistributedContact(Peer("e", 5));
        CHECK(c.announced_ids() == std::vector<std::string>{"e"});
        CHECK_FALSE(book->GetContact("b")->IsActive());
        CHECK(book->GetContact("c")->IsActive());
        CHECK(net.send_count() == 2);
    }
}

TEST_CASE("AddressBook: delivery outcome drives liveness", "[address_book][liveness][unit]") {
    MockTimeScope mock_time(1'700'000'000);
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox b(net, "10.0.0.2", kPort);
    auto book = MakeBook(net, self, {Peer("b", 2), Peer("c", 3)});

    SECTION("Success keeps the contact active") {
        CHECK(book->SendMessageToContact(Peer("b", 2), MakePing()));
        CHECK(book->GetContact("b")->IsActive());
    }

    SECTION("DeliveryError marks the contact inactive at the current time") {
        CHECK_FALSE(book->SendMessageToContact(Peer("c", 3), MakePing()));
        auto c = book->GetContact("c");
        REQUIRE(c);
        CHECK_FALSE(c->IsActive());
        CHECK(c->first_failure() == 1'700'000'000);
        CHECK(book->inactive_count() == 1);

        mock_time.Advance(30);
        CHECK_FALSE(book->SendMessageToContact(Peer("c", 3), MakePing()));
        CHECK(book->GetContact("c")->first_failure() == 1'700'000'000);
    }

    SECTION("First success after a streak reactivates") {
        CHECK_FALSE(book->SendMessageToContact(Peer("c", 3), MakePing()));
        Inbox c(net, "10.0.0.3", kPort);
        CHECK(book->SendMessageToContact(Peer("c", 3), MakePing()));
        CHECK(book->GetContact("c")->IsActive());
        CHECK(book->inactive_count() == 0);
    }

    SECTION("Liveness is looked up by id, not by the recipient object") {
        Contact stale("c", "10.0.0.3", kPort, 5);
        CHECK_FALSE(book->SendMessageToContact(stale, MakePing()));
        CHECK(book->GetContact("c")->first_failure() == 1'700'000'000);
    }

    SECTION("Unknown recipients leave the view untouched") {
        CHECK_FALSE(book->SendMessageToContact(Peer("stranger", 9), MakePing()));
        CHECK_FALSE(book->HasContact("stranger"));
        CHECK(book->size() == 2);
    }

    SECTION("Self is never messaged") {
        CHECK_FALSE(book->SendMessageToContact(self, MakePing()));
        CHECK(net.sends_to(self.address()) == 0);
    }
}

TEST_CASE("AddressBook: non-delivery exceptions propagate", "[address_book][liveness][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    AddressBook book(self, {Peer("b", 2)}, std::make_shared<ExplodingSender>(), net.CreateReceiver(self.host()),
                     ManualConfig());

    CHECK_THROWS_AS(book.SendMessageToContact(Peer("b", 2), MakePing()), std::logic_error);
    CHECK(book.GetContact("b")->IsActive());
}

TEST_CASE("AddressBook: ping and unknown commands have no effect", "[address_book][gossip][unit]") {
    MockTimeScope mock_time(2'000'000);
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox a(net, "10.0.0.2", kPort);
    auto book = MakeBook(net, self, {Peer("a", 2), Peer("b", 3)});
    REQUIRE_FALSE(book->SendMessageToContact(Peer("b", 3), MakePing()));
    net.ClearSends();

    const auto before = book->GetContacts();

    auto noop = ParseEnvelope(R"({"command":"noop"})");
    REQUIRE(noop);
    REQUIRE(std::holds_alternative<UnknownMessage>(*noop));

    REQUIRE_NOTHROW(book->Notify(*noop));
    REQUIRE_NOTHROW(book->Notify(MakePing()));
    REQUIRE_NOTHROW(book->Notify(UnknownMessage{"remove-contact"}));

    const auto after = book->GetContacts();
    REQUIRE(after.size() == before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        CHECK(after[i].SameIdentity(before[i]));
        CHECK(after[i].first_failure() == before[i].first_failure());
    }
    CHECK(net.send_count() == 0);
}

TEST_CASE("AddressBook: eviction after the restore timeout", "[address_book][eviction][unit]") {
    const int64_t t0 = 1'000'000;
    MockTimeScope mock_time(t0);
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    Inbox a(net, "10.0.0.2", kPort);
    auto book = MakeBook(net, self, {Peer("a", 2), Peer("b", 3)}, ManualConfig(60s));

    // b never answers from t0 on
    REQUIRE_FALSE(book->SendMessageToContact(Peer("b", 3), MakePing()));
    net.ClearSends();

    SECTION("Probe cycles at a 20s interval evict at the first cycle >= t0 + timeout") {
        mock_time.Advance(20);
        book->test_hook_probe_inactive_contacts();
        CHECK(book->HasContact("b"));

        mock_time.Advance(20);
        book->test_hook_probe_inactive_contacts();
        CHECK(book->HasContact("b"));

        mock_time.Advance(20);
        book->test_hook_probe_inactive_contacts();
        CHECK_FALSE(book->HasContact("b"));

        CHECK(net.sends_to(Peer("b", 3).address(), "ping") == 3);
        CHECK(book->HasContact("a"));
    }

    SECTION("Timeout counts from the first failure of the streak") {
        mock_time.Advance(50);
        REQUIRE_FALSE(book->SendMessageToContact(Peer("b", 3), MakePing()));
        mock_time.Advance(10);
        book->test_hook_probe_inactive_contacts();
        CHECK_FALSE(book->HasContact("b"));
    }

    SECTION("A contact that recovers is not evicted") {
        mock_time.Advance(30);
        Inbox b(net, "10.0.0.3", kPort);
        book->test_hook_probe_inactive_contacts();
        REQUIRE(book->HasContact("b"));
        CHECK(book->GetContact("b")->IsActive());
        CHECK(b.received().size() == 1);

        // Active contacts are not probed, however long
        mock_time.Advance(100'000);
        net.ClearSends();
        book->test_hook_probe_inactive_contacts();
        CHECK(book->HasContact("b"));
        CHECK(net.send_count() == 0);
    }

    SECTION("Recovery after the timeout elapsed still saves the contact") {
        mock_time.Advance(500);
        Inbox b(net, "10.0.0.3", kPort);
        book->test_hook_probe_inactive_contacts();
        CHECK(book->HasContact("b"));
        CHECK(book->GetContact("b")->IsActive());
    }
}

TEST_CASE("AddressBook: probe cycle with nothing inactive sends nothing", "[address_book][eviction][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    auto book = MakeBook(net, self, {Peer("a", 2), Peer("b", 3)});

    book->test_hook_probe_inactive_contacts();
    CHECK(net.send_count() == 0);
    CHECK(book->size() == 2);
}

TEST_CASE("AddressBook: background worker evicts on its own", "[address_book][eviction][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);
    AddressBook::Config config;
    config.contact_restore_timeout = 0s;
    config.inactive_ping_interval = 20ms;
    config.receiver_notify_interval = 0ms;
    auto book = MakeBook(net, self, {Peer("gone", 2), Peer("also-gone", 3)}, config);

    REQUIRE_FALSE(book->SendMessageToContact(Peer("gone", 2), MakePing()));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (book->HasContact("gone") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK_FALSE(book->HasContact("gone"));
    // Never failed a send, so never probed
    CHECK(book->HasContact("also-gone"));
    book->Stop();
}

TEST_CASE("AddressBook: three node introduction scenario", "[address_book][gossip][scenario]") {
    SimulatedNetwork net;
    auto node1 = MakeBook(net, Peer("1", 1), {});
    auto node2 = MakeBook(net, Peer("2", 2), {});
    auto node3 = MakeBook(net, Peer("3", 3), {});

    node1->CreateNewDistributedContact(node2->self());
    CHECK(Ids(node1->GetContacts()) == std::vector<std::string>{"2"});
    CHECK(net.send_count() == 0);

    node1->CreateNewDistributedContact(node3->self());

    auto sends = net.sends();
    REQUIRE(sends.size() == 1);
    CHECK(sends[0].to == node2->self().address());
    CHECK(sends[0].command == plebnet::protocol::commands::ADD_CONTACT);
    CHECK(sends[0].contact_id == "3");
    CHECK(sends[0].delivered);

    CHECK(Ids(node1->GetContacts()) == std::vector<std::string>{"2", "3"});
    CHECK(Ids(node2->GetContacts()) == std::vector<std::string>{"3"});
    CHECK(node3->size() == 0);
}

TEST_CASE("AddressBook: announcements spread along a chain", "[address_book][gossip][scenario]") {
    SimulatedNetwork net;
    constexpr int kNodes = 6;
    std::vector<std::unique_ptr<AddressBook>> nodes;
    // node i initially knows node i+1 only
    for (int i = 0; i < kNodes; ++i) {
        std::vector<Contact> known;
        if (i + 1 < kNodes) {
            known.push_back(Peer("n" + std::to_string(i + 1), i + 2));
        }
        nodes.push_back(MakeBook(net, Peer("n" + std::to_string(i), i + 1), known));
    }
    auto newcomer = MakeBook(net, Peer("new", 50), {});

    nodes[0]->CreateNewDistributedContact(newcomer->self());

    for (const auto& node : nodes) {
        CHECK(node->HasContact("new"));
    }
    // The newcomer itself is never told about itself
    CHECK(net.sends_to(newcomer->self().address()) == 0);
    // One announcement per hop
    CHECK(net.send_count() == static_cast<size_t>(kNodes - 1));
}

TEST_CASE("AddressBook: inbound traffic during construction", "[address_book][concurrency][unit]") {
    SimulatedNetwork net;
    constexpr int kBurst = 64;
    auto receiver = std::make_shared<EagerReceiver>(kBurst);

    auto book = std::make_unique<AddressBook>(Peer("self", 1), std::vector<Contact>{Peer("a", 2)},
                                              net.CreateSender(), receiver, ManualConfig());
    book->Stop();

    CHECK_FALSE(receiver->IsRunning());
    CHECK(book->size() == static_cast<size_t>(kBurst + 1));
    CHECK(book->HasContact("a"));
    CHECK(book->HasContact("early-0"));
    CHECK(book->HasContact("early-" + std::to_string(kBurst - 1)));
}

// Run under -fsanitize=thread to catch unserialized access to the contact map
TEST_CASE("AddressBook: concurrent gossip, sends and eviction", "[address_book][concurrency][unit]") {
    SimulatedNetwork net;
    const Contact self = Peer("self", 1);

    constexpr int kReachable = 4;
    constexpr int kUnreachable = 8;
    constexpr int kRounds = 150;

    std::vector<Contact> reachable;
    std::vector<std::unique_ptr<Inbox>> inboxes;
    for (int i = 0; i < kReachable; ++i) {
        reachable.push_back(Contact("r" + std::to_string(i), "10.0.1." + std::to_string(i + 1), kPort));
        inboxes.push_back(std::make_unique<Inbox>(net, reachable.back().host(), kPort));
    }
    // Nothing listens on these, so every send fails
    std::vector<Contact> unreachable;
    for (int i = 0; i < kUnreachable; ++i) {
        unreachable.push_back(Contact("u" + std::to_string(i), "10.0.2." + std::to_string(i + 1), kPort));
        net.SetUnreachable(unreachable.back().address());
    }

    AddressBook::Config config;
    config.contact_restore_timeout = 0s;
    config.inactive_ping_interval = 1ms;
    config.receiver_notify_interval = 0ms;
    auto book = MakeBook(net, self, {}, config);

    std::vector<std::thread> threads;
    // Two inbound handlers announcing overlapping ids, self included
    for (int t = 0; t < 2; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kRounds; ++i) {
                book->Notify(MakeAddContact(unreachable[(i + t) % kUnreachable]));
                book->Notify(MakeAddContact(reachable[(i + t) % kReachable]));
                if (i % 10 == 0) {
                    book->Notify(MakeAddContact(self));
                }
            }
        });
    }
    threads.emplace_back([&]() {
        for (int i = 0; i < kRounds; ++i) {
            book->CreateNewDistributedContact(i % 2 == 0 ? reachable[i % kReachable] : unreachable[i % kUnreachable]);
        }
    });
    threads.emplace_back([&]() {
        for (int i = 0; i < kRounds; ++i) {
            book->SendMessageToContact(unreachable[i % kUnreachable], MakePing());
            book->SendMessageToContact(reachable[i % kReachable], MakePing());
            book->SendMessageToContact(self, MakePing());
        }
    });
    threads.emplace_back([&]() {
        for (int i = 0; i < kRounds; ++i) {
            book->GetContacts();
            book->inactive_count();
        }
    });
    for (auto& th : threads) {
        th.join();
    }

    auto contacts = book->GetContacts();
    std::set<std::string> ids;
    size_t inactive = 0;
    for (const auto& c : contacts) {
        CHECK(c.id() != self.id());
        CHECK(ids.insert(c.id()).second);
        if (!c.IsActive()) {
            ++inactive;
            CHECK(*c.first_failure() <= plebnet::util::GetTime());
        }
    }
    CHECK(book->inactive_count() == inactive);

    // Reachable contacts never fail a delivery, so they are never evicted
    for (const auto& c : reachable) {
        auto stored = book->GetContact(c.id());
        REQUIRE(stored);
        CHECK(stored->IsActive());
    }

    // One more failed send each, then a probe cycle clears every unreachable contact
    for (const auto& c : unreachable) {
        book->SendMessageToContact(c, MakePing());
    }
    book->test_hook_probe_inactive_contacts();
    for (const auto& c : unreachable) {
        CHECK_FALSE(book->HasContact(c.id()));
    }
    CHECK(book->size() == static_cast<size_t>(kReachable));
    book->Stop();
}
