/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include "client.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rtc_base/thread.h>

#include "fake_peer_transport.h"
#include "fake_relay.h"
#include "status.h"
#include "test_helpers.h"

namespace {

const char kRelayA[] = "ws://relay-a.test/";
const char kRelayB[] = "ws://relay-b.test/";

const DiscoveryEventType kAllEvents[] = {
    DiscoveryEventType::kReady,          DiscoveryEventType::kPeerConnected,
    DiscoveryEventType::kPeerFailed,     DiscoveryEventType::kPeerDisconnected,
    DiscoveryEventType::kStatsUpdate,    DiscoveryEventType::kScrape,
    DiscoveryEventType::kRelayFailure,   DiscoveryEventType::kError,
    DiscoveryEventType::kClosed,
};

struct TestPeer {
  std::unique_ptr<FakePeerTransportFactory> transports;
  std::unique_ptr<PeerDiscoveryClient> client;
  std::map<DiscoveryEventType, std::vector<DiscoveryEvent>> events;
  bool start_done = false;
  SwarmError start_error;

  size_t count(DiscoveryEventType type) const {
    auto it = events.find(type);
    return it == events.end() ? 0 : it->second.size();
  }
  const DiscoveryEvent& last(DiscoveryEventType type) const {
    return events.at(type).back();
  }
  std::shared_ptr<PeerSession> session() const {
    return last(DiscoveryEventType::kPeerConnected).session;
  }
};

}  // namespace

class PeerDiscoveryClientTest : public ::testing::Test {
 protected:
  PeerDiscoveryClientTest() {
    relay_a_ = relays_.AddRelay(kRelayA);
    relay_b_ = relays_.AddRelay(kRelayB);
  }

  SwarmOptions Options(const std::string& peer_id) {
    SwarmOptions opts;
    opts.topic = "client-test";
    opts.peer_id = peer_id;
    opts.relay_urls = {kRelayA, kRelayB};
    opts.numwant = 10;
    opts.announce_interval_ms = 50;
    opts.max_announce_interval_ms = 100;
    opts.backoff_multiplier = 1.0;
    // Long enough that no offer expires unless a test wants it to.
    opts.offer_timeout_ms = 5000;
    opts.negotiation_timeout_ms = 500;
    opts.ice_gathering_timeout_ms = 100;
    opts.startup_timeout_ms = 300;
    opts.relay_connect_timeout_ms = 200;
    return opts;
  }

  TestPeer* AddPeer(const SwarmOptions& opts) {
    auto peer = std::make_unique<TestPeer>();
    peer->transports = std::make_unique<FakePeerTransportFactory>(&network_);
    peer->client = std::make_unique<PeerDiscoveryClient>(
        opts, peer->transports.get(), &relays_);
    TestPeer* raw = peer.get();
    for (DiscoveryEventType type : kAllEvents) {
      raw->client->AddHandler(type, [raw, type](const DiscoveryEvent& event) {
        raw->events[type].push_back(event);
      });
    }
    peers_.push_back(std::move(peer));
    return raw;
  }

  bool Start(TestPeer* peer) {
    return peer->client->Start([peer](const SwarmError& error) {
      peer->start_done = true;
      peer->start_error = error;
    });
  }

  TestPeer* StartPeer(const SwarmOptions& opts) {
    TestPeer* peer = AddPeer(opts);
    EXPECT_TRUE(Start(peer));
    EXPECT_TRUE(WaitFor([peer] { return peer->start_done; }));
    EXPECT_TRUE(peer->start_error.ok()) << peer->start_error.message;
    return peer;
  }

  static bool Connected(const TestPeer* a, const TestPeer* b) {
    return a->count(DiscoveryEventType::kPeerConnected) > 0 &&
           b->count(DiscoveryEventType::kPeerConnected) > 0;
  }

  Json::Value Offer(const std::string& from, const std::string& offer_id) {
    Json::Value message(Json::objectValue);
    message[Tracker::kAction] = Tracker::kAnnounce;
    message[Tracker::kInfoHash] = SwarmInfoHashFromTopic("client-test");
    message[Tracker::kPeerId] = from;
    message[Tracker::kOfferId] = offer_id;
    message[Tracker::kOffer] = SignalMessageToJson(SignalMessage::Offer("fake-offer:999"));
    return message;
  }

  // The relayed form of |peer_id|'s first announced offer.
  Json::Value RelayedOfferFrom(FakeRelay* relay, const std::string& peer_id) {
    for (const Json::Value& message : relay->received()) {
      if (message[Tracker::kPeerId].asString() == peer_id &&
          message[Tracker::kOffers].isArray() && message[Tracker::kOffers].size() > 0) {
        Json::Value forward(Json::objectValue);
        forward[Tracker::kAction] = Tracker::kAnnounce;
        forward[Tracker::kInfoHash] = message[Tracker::kInfoHash];
        forward[Tracker::kPeerId] = peer_id;
        forward[Tracker::kOfferId] = message[Tracker::kOffers][0][Tracker::kOfferId];
        forward[Tracker::kOffer] = message[Tracker::kOffers][0][Tracker::kOffer];
        return forward;
      }
    }
    ADD_FAILURE() << "No offer from " << peer_id;
    return Json::Value(Json::objectValue);
  }

  Json::Value Answer(const std::string& from,
                     const std::string& to,
                     const std::string& offer_id) {
    return BuildAnswer(SwarmInfoHashFromTopic("client-test"), from, to, offer_id,
                       "fake-answer:999");
  }

  rtc::AutoThread main_thread_;
  FakeTransportNetwork network_;
  FakeRelayFactory relays_;
  FakeRelay* relay_a_ = nullptr;
  FakeRelay* relay_b_ = nullptr;
  std::vector<std::unique_ptr<TestPeer>> peers_;
};

TEST_F(PeerDiscoveryClientTest, StartAnnouncesFirstOfferOnEveryRelay) {
  TestPeer* alice = StartPeer(Options("alice"));
  EXPECT_EQ(alice->count(DiscoveryEventType::kReady), 1u);
  EXPECT_TRUE(alice->client->ready());
  EXPECT_EQ(alice->client->relay_count(), 2u);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 1u);

  for (FakeRelay* relay : {relay_a_, relay_b_}) {
    ASSERT_FALSE(relay->received().empty());
    const Json::Value& first = relay->received().front();
    EXPECT_EQ(first[Tracker::kInfoHash].asString(),
              SwarmInfoHashFromTopic("client-test"));
    EXPECT_EQ(first[Tracker::kNumWant].asInt(), 10);
    ASSERT_EQ(first[Tracker::kOffers].size(), 1u);
  }
  // One offer shared by both relays.
  EXPECT_EQ(relay_a_->received().front()[Tracker::kOffers][0][Tracker::kOfferId],
            relay_b_->received().front()[Tracker::kOffers][0][Tracker::kOfferId]);
  EXPECT_EQ(alice->client->info_hash(), SwarmInfoHashFromTopic("client-test"));
}

TEST_F(PeerDiscoveryClientTest, ReannouncesOnSchedule) {
  TestPeer* alice = StartPeer(Options("alice"));
  ASSERT_TRUE(WaitFor([&] { return relay_a_->announces_from("alice") >= 4; }));
  // The first offer is still outstanding, so later announces carry none.
  EXPECT_EQ(relay_a_->offers_from("alice"), 1);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 1u);
  const TrackerConnection* tracker = alice->client->tracker(kRelayA);
  ASSERT_NE(tracker, nullptr);
  EXPECT_TRUE(tracker->announcing());
  EXPECT_GE(tracker->announce_count(), 3);
}

TEST_F(PeerDiscoveryClientTest, InvalidOptionsOrSecondStartAreRejected) {
  SwarmOptions bad = Options("alice");
  bad.backoff_multiplier = 0.5;
  TestPeer* broken = AddPeer(bad);
  EXPECT_FALSE(Start(broken));

  TestPeer* bob = StartPeer(Options("bob"));
  EXPECT_FALSE(Start(bob));
}

TEST_F(PeerDiscoveryClientTest, TwoPeersConnectOnce) {
  TestPeer* alice = StartPeer(Options("alice"));
  TestPeer* bob = StartPeer(Options("bob"));

  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));
  EXPECT_EQ(alice->last(DiscoveryEventType::kPeerConnected).peer_id, "bob");
  EXPECT_EQ(bob->last(DiscoveryEventType::kPeerConnected).peer_id, "alice");
  EXPECT_TRUE(alice->client->IsConnectedTo("bob"));
  EXPECT_TRUE(bob->client->IsConnectedTo("alice"));

  // Bob's offer reached alice through both relays; only one answer went back,
  // through a single relay.
  RunFor(300);
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerConnected), 1u);
  EXPECT_EQ(bob->count(DiscoveryEventType::kPeerConnected), 1u);
  EXPECT_EQ(relay_a_->answers_from("alice") + relay_b_->answers_from("alice"), 1);
  EXPECT_EQ(alice->client->connected_peer_count(), 1u);
  EXPECT_EQ(alice->client->negotiating_count(), 0u);

  std::shared_ptr<PeerSession> to_bob = alice->session();
  std::shared_ptr<PeerSession> to_alice = bob->session();
  std::vector<std::string> received;
  to_alice->AddHandler(SessionEventType::kData,
                       [&received](const SessionEvent& e) { received.push_back(e.data); });
  EXPECT_TRUE(to_bob->Send("hello"));
  ASSERT_TRUE(WaitFor([&] { return !received.empty(); }));
  EXPECT_EQ(received[0], "hello");
}

TEST_F(PeerDiscoveryClientTest, ExchangeThroughSingleRelay) {
  SwarmOptions alice_opts = Options("alice");
  alice_opts.relay_urls = {kRelayA};
  SwarmOptions bob_opts = Options("bob");
  bob_opts.relay_urls = {kRelayA};
  TestPeer* alice = StartPeer(alice_opts);
  TestPeer* bob = StartPeer(bob_opts);
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));
  EXPECT_TRUE(relay_b_->received().empty());

  std::vector<std::string> at_alice;
  std::vector<std::string> at_bob;
  alice->session()->AddHandler(SessionEventType::kData, [&at_alice](const SessionEvent& e) {
    at_alice.push_back(e.data);
  });
  bob->session()->AddHandler(SessionEventType::kData, [&at_bob](const SessionEvent& e) {
    at_bob.push_back(e.data);
  });
  const std::string payload = "{\"text\":\"ping\"}\n\x01";
  EXPECT_TRUE(alice->session()->Send(payload));
  EXPECT_TRUE(bob->session()->Send("pong"));
  ASSERT_TRUE(WaitFor([&] { return !at_alice.empty() && !at_bob.empty(); }));
  EXPECT_EQ(at_bob[0], payload);
  EXPECT_EQ(at_alice[0], "pong");
}

TEST_F(PeerDiscoveryClientTest, CrossedOffersLeaveOneSession) {
  relay_a_->set_forward_offers(false);
  SwarmOptions alice_opts = Options("alice");
  alice_opts.relay_urls = {kRelayA};
  SwarmOptions bob_opts = Options("bob");
  bob_opts.relay_urls = {kRelayA};
  TestPeer* alice = StartPeer(alice_opts);
  TestPeer* bob = StartPeer(bob_opts);

  // Each side receives the other's offer while its own is outstanding.
  relay_a_->InjectTo("bob", RelayedOfferFrom(relay_a_, "alice"));
  relay_a_->InjectTo("alice", RelayedOfferFrom(relay_a_, "bob"));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));
  RunFor(300);

  for (TestPeer* peer : {alice, bob}) {
    EXPECT_EQ(peer->count(DiscoveryEventType::kPeerConnected), 1u);
    EXPECT_EQ(peer->count(DiscoveryEventType::kPeerDisconnected), 0u);
    EXPECT_EQ(peer->count(DiscoveryEventType::kPeerFailed), 0u);
    EXPECT_EQ(peer->client->connected_peer_count(), 1u);
    EXPECT_EQ(peer->client->negotiating_count(), 0u);
  }
  // The handshake offered by the smaller peer id survives on both ends.
  EXPECT_TRUE(alice->session()->initiator());
  EXPECT_FALSE(bob->session()->initiator());
  EXPECT_EQ(alice->session()->state(), PeerSession::State::kConnected);
  EXPECT_EQ(bob->session()->state(), PeerSession::State::kConnected);

  std::vector<std::string> at_bob;
  bob->session()->AddHandler(SessionEventType::kData, [&at_bob](const SessionEvent& e) {
    at_bob.push_back(e.data);
  });
  EXPECT_TRUE(alice->session()->Send("one link"));
  ASSERT_TRUE(WaitFor([&] { return !at_bob.empty(); }));
  EXPECT_EQ(at_bob[0], "one link");
}

TEST_F(PeerDiscoveryClientTest, OffersFromConnectedPeersAreIgnored) {
  TestPeer* alice = StartPeer(Options("alice"));
  TestPeer* bob = StartPeer(Options("bob"));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));

  int created = alice->transports->created();
  relay_a_->InjectTo("alice", Offer("bob", "another-offer"));
  RunFor(50);
  EXPECT_EQ(alice->transports->created(), created);
  EXPECT_EQ(alice->client->negotiating_count(), 0u);
}

TEST_F(PeerDiscoveryClientTest, OwnOfferIsIgnored) {
  TestPeer* alice = StartPeer(Options("alice"));
  int created = alice->transports->created();
  relay_a_->InjectTo("alice", Offer("alice", "mine"));
  RunFor(50);
  EXPECT_EQ(alice->transports->created(), created);
  EXPECT_EQ(alice->client->negotiating_count(), 0u);
}

TEST_F(PeerDiscoveryClientTest, RelayedOfferStartsResponder) {
  TestPeer* alice = StartPeer(Options("alice"));
  relay_a_->InjectTo("alice", Offer("carol", "carol-offer"));
  relay_b_->InjectTo("alice", Offer("carol", "carol-offer"));
  ASSERT_TRUE(WaitFor([&] { return relay_a_->answers_from("alice") +
                                       relay_b_->answers_from("alice") == 1; }));
  RunFor(50);
  EXPECT_EQ(relay_a_->answers_from("alice") + relay_b_->answers_from("alice"), 1);
  EXPECT_EQ(alice->client->negotiating_count(), 1u);

  const Json::Value* answer = nullptr;
  for (FakeRelay* relay : {relay_a_, relay_b_}) {
    for (const auto& message : relay->received()) {
      if (message.isMember(Tracker::kAnswer)) {
        answer = &message;
      }
    }
  }
  ASSERT_NE(answer, nullptr);
  EXPECT_EQ((*answer)[Tracker::kToPeerId].asString(), "carol");
  EXPECT_EQ((*answer)[Tracker::kOfferId].asString(), "carol-offer");
  EXPECT_EQ((*answer)[Tracker::kAnswer]["type"].asString(), "answer");
}

TEST_F(PeerDiscoveryClientTest, StaleAndMisaddressedAnswersAreIgnored) {
  TestPeer* alice = StartPeer(Options("alice"));
  relay_a_->InjectTo("alice", Answer("carol", "alice", "no-such-offer"));

  std::string offer_id =
      relay_a_->received().front()[Tracker::kOffers][0][Tracker::kOfferId].asString();
  relay_a_->InjectTo("alice", Answer("carol", "someone-else", offer_id));
  RunFor(50);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 1u);
  EXPECT_EQ(alice->client->negotiating_count(), 0u);
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerFailed), 0u);
}

TEST_F(PeerDiscoveryClientTest, UnansweredOfferExpiresAndIsReplaced) {
  SwarmOptions opts = Options("alice");
  opts.offer_timeout_ms = 100;
  TestPeer* alice = StartPeer(opts);
  ASSERT_FALSE(alice->transports->created_ids().empty());
  const int first_offer = alice->transports->created_ids().front();
  size_t most_outstanding = 0;
  ASSERT_TRUE(WaitFor([&] {
    most_outstanding =
        std::max(most_outstanding, alice->client->outstanding_offer_count());
    return relay_a_->offers_from("alice") + relay_b_->offers_from("alice") >= 4;
  }));
  EXPECT_EQ(most_outstanding, 1u);
  // The expired offer's session was closed and its transport released.
  EXPECT_TRUE(network_.WasClosed(first_offer));
  EXPECT_EQ(network_.Find(first_offer), nullptr);
  EXPECT_GE(alice->transports->created(), 3);
  // Expired offers fail nobody; no remote peer was involved.
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerFailed), 0u);
}

TEST_F(PeerDiscoveryClientTest, RaisedOfferLimitAllowsMoreOutstanding) {
  SwarmOptions opts = Options("alice");
  opts.max_outstanding_offers = 3;
  TestPeer* alice = StartPeer(opts);
  ASSERT_TRUE(WaitFor([&] { return alice->client->outstanding_offer_count() == 3u; }));
  RunFor(200);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 3u);
}

TEST_F(PeerDiscoveryClientTest, PartialRelayOutage) {
  relay_b_->set_refuse(true);
  TestPeer* alice = StartPeer(Options("alice"));
  EXPECT_EQ(alice->client->relay_count(), 1u);
  ASSERT_EQ(alice->count(DiscoveryEventType::kError), 1u);
  const DiscoveryEvent& error = alice->last(DiscoveryEventType::kError);
  EXPECT_EQ(error.relay_url, kRelayB);
  EXPECT_EQ(error.error.type, SwarmErrorType::kRelayUnreachable);
  EXPECT_EQ(relay_a_->offers_from("alice"), 1);
}

TEST_F(PeerDiscoveryClientTest, NoReachableRelayFailsStart) {
  relay_a_->set_refuse(true);
  relay_b_->set_hang(true);
  TestPeer* alice = AddPeer(Options("alice"));
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  EXPECT_EQ(alice->start_error.type, SwarmErrorType::kRelayUnreachable);
  EXPECT_EQ(alice->count(DiscoveryEventType::kReady), 0u);
  EXPECT_EQ(alice->count(DiscoveryEventType::kError), 2u);
  EXPECT_FALSE(alice->client->ready());
  EXPECT_EQ(alice->client->outstanding_offer_count(), 0u);
}

TEST_F(PeerDiscoveryClientTest, UnusableRelayUrlsFailStart) {
  SwarmOptions opts = Options("alice");
  opts.relay_urls = {"ws://unknown.test/"};
  TestPeer* alice = AddPeer(opts);
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  EXPECT_EQ(alice->start_error.type, SwarmErrorType::kRelayUnreachable);
}

TEST_F(PeerDiscoveryClientTest, StartsWithoutOfferWhenTransportsFail) {
  TestPeer* alice = AddPeer(Options("alice"));
  alice->transports->set_fail_create(true);
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  EXPECT_TRUE(alice->start_error.ok());
  EXPECT_EQ(alice->count(DiscoveryEventType::kReady), 1u);
  EXPECT_GE(relay_a_->announces_from("alice"), 1);
  EXPECT_EQ(relay_a_->offers_from("alice"), 0);
}

TEST_F(PeerDiscoveryClientTest, FailedOfferIdHoldsNoOfferSlot) {
  TestPeer* alice = AddPeer(Options("alice"));
  alice->client->SetOfferIdGeneratorForTesting([] { return std::string(); });
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  EXPECT_TRUE(alice->start_error.ok());
  EXPECT_EQ(alice->client->outstanding_offer_count(), 0u);
  EXPECT_EQ(alice->transports->created(), 0);
  EXPECT_EQ(relay_a_->offers_from("alice"), 0);

  // Once ids can be drawn again the next scheduled announce carries an offer.
  alice->client->SetOfferIdGeneratorForTesting(SwarmCreateOfferId);
  ASSERT_TRUE(WaitFor([&] {
    return relay_a_->offers_from("alice") + relay_b_->offers_from("alice") > 0;
  }));
  EXPECT_EQ(alice->client->outstanding_offer_count(), 1u);
}

TEST_F(PeerDiscoveryClientTest, SlowOfferDoesNotBlockStartup) {
  SwarmOptions opts = Options("alice");
  opts.ice_gathering_timeout_ms = 2000;
  opts.startup_timeout_ms = 100;
  TestPeer* alice = AddPeer(opts);
  alice->transports->options().never_complete_gathering = true;
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  EXPECT_EQ(alice->count(DiscoveryEventType::kReady), 1u);
  EXPECT_EQ(relay_a_->offers_from("alice"), 0);
  // The offer is announced once gathering gives up.
  ASSERT_TRUE(WaitFor([&] { return relay_a_->offers_from("alice") == 1; }, 3000));
}

TEST_F(PeerDiscoveryClientTest, LastRelayClosingClosesDiscovery) {
  TestPeer* alice = StartPeer(Options("alice"));
  relay_a_->Disconnect();
  ASSERT_TRUE(WaitFor([&] { return alice->client->relay_count() == 1u; }));
  EXPECT_EQ(alice->count(DiscoveryEventType::kError), 1u);
  EXPECT_EQ(alice->last(DiscoveryEventType::kError).error.type,
            SwarmErrorType::kRelayDisconnected);
  EXPECT_EQ(alice->count(DiscoveryEventType::kClosed), 0u);

  relay_b_->Disconnect();
  ASSERT_TRUE(WaitFor([&] { return alice->count(DiscoveryEventType::kClosed) == 1u; }));
  EXPECT_EQ(alice->client->relay_count(), 0u);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 0u);
  EXPECT_FALSE(alice->client->ready());
}

TEST_F(PeerDiscoveryClientTest, LosingEveryRelayKeepsConnectedSessions) {
  TestPeer* alice = StartPeer(Options("alice"));
  TestPeer* bob = StartPeer(Options("bob"));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));

  relay_a_->Disconnect();
  relay_b_->Disconnect();
  ASSERT_TRUE(WaitFor([&] {
    return alice->count(DiscoveryEventType::kClosed) == 1u &&
           bob->count(DiscoveryEventType::kClosed) == 1u;
  }));
  EXPECT_EQ(alice->client->outstanding_offer_count(), 0u);
  EXPECT_EQ(bob->client->outstanding_offer_count(), 0u);
  EXPECT_TRUE(alice->client->IsConnectedTo("bob"));
  EXPECT_TRUE(bob->client->IsConnectedTo("alice"));
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerDisconnected), 0u);
  EXPECT_EQ(bob->count(DiscoveryEventType::kPeerDisconnected), 0u);

  std::vector<std::string> at_bob;
  bob->session()->AddHandler(SessionEventType::kData, [&at_bob](const SessionEvent& e) {
    at_bob.push_back(e.data);
  });
  EXPECT_TRUE(alice->session()->Send("still here"));
  ASSERT_TRUE(WaitFor([&] { return !at_bob.empty(); }));
  EXPECT_EQ(at_bob[0], "still here");
}

TEST_F(PeerDiscoveryClientTest, RelayFailureReasonIsReported) {
  TestPeer* alice = StartPeer(Options("alice"));
  relay_a_->Inject(R"({"failure reason":"info_hash is banned"})");
  ASSERT_TRUE(WaitFor([&] { return alice->count(DiscoveryEventType::kRelayFailure) == 1u; }));
  EXPECT_EQ(alice->last(DiscoveryEventType::kRelayFailure).reason, "info_hash is banned");
  EXPECT_EQ(alice->last(DiscoveryEventType::kRelayFailure).relay_url, kRelayA);
  EXPECT_TRUE(alice->client->ready());
}

TEST_F(PeerDiscoveryClientTest, StatsAndScrapeAreReported) {
  TestPeer* alice = StartPeer(Options("alice"));
  ASSERT_TRUE(WaitFor([&] { return alice->count(DiscoveryEventType::kStatsUpdate) > 0; }));
  EXPECT_EQ(alice->client->discovered_peer_count(), 1);

  relay_a_->set_send_stats(false);
  relay_b_->set_send_stats(false);
  RunFor(20);

  const std::string info_hash = SwarmInfoHashFromTopic("client-test");
  relay_a_->Inject(R"({"action":"announce","info_hash":")" + info_hash +
                   R"(","complete":4,"incomplete":3})");
  ASSERT_TRUE(WaitFor([&] { return alice->client->discovered_peer_count() == 7; }));
  EXPECT_EQ(alice->last(DiscoveryEventType::kStatsUpdate).complete, 4);
  EXPECT_EQ(alice->last(DiscoveryEventType::kStatsUpdate).incomplete, 3);

  // Missing counters read as zero.
  relay_a_->Inject(R"({"action":"announce","info_hash":")" + info_hash +
                   R"(","complete":2})");
  ASSERT_TRUE(WaitFor([&] { return alice->client->discovered_peer_count() == 2; }));

  relay_a_->Inject(R"({"action":"scrape","files":{}})");
  ASSERT_TRUE(WaitFor([&] { return alice->count(DiscoveryEventType::kScrape) == 1u; }));
  EXPECT_TRUE(alice->last(DiscoveryEventType::kScrape).scrape.isMember("files"));
}

TEST_F(PeerDiscoveryClientTest, MalformedAndForeignMessagesAreDropped) {
  TestPeer* alice = StartPeer(Options("alice"));
  relay_a_->set_send_stats(false);
  relay_b_->set_send_stats(false);
  RunFor(20);
  size_t stats = alice->count(DiscoveryEventType::kStatsUpdate);

  relay_a_->Inject("this is not json");
  relay_a_->Inject("[\"array\"]");
  relay_a_->Inject(R"({"action":"announce","info_hash":"other","complete":9})");
  relay_a_->Inject(R"({"action":"announce","peer_id":"x","offer_id":"o","offer":{"type":"bogus"}})");
  RunFor(50);
  EXPECT_EQ(alice->count(DiscoveryEventType::kStatsUpdate), stats);
  EXPECT_EQ(alice->client->negotiating_count(), 0u);
  EXPECT_TRUE(alice->client->ready());
  EXPECT_EQ(alice->client->relay_count(), 2u);
}

TEST_F(PeerDiscoveryClientTest, RemoteCloseReportsDisconnect) {
  TestPeer* alice = StartPeer(Options("alice"));
  TestPeer* bob = StartPeer(Options("bob"));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));

  bob->session()->Close();
  ASSERT_TRUE(WaitFor(
      [&] { return alice->count(DiscoveryEventType::kPeerDisconnected) == 1u; }));
  EXPECT_EQ(alice->last(DiscoveryEventType::kPeerDisconnected).peer_id, "bob");
  EXPECT_EQ(bob->count(DiscoveryEventType::kPeerDisconnected), 1u);
  EXPECT_FALSE(alice->client->IsConnectedTo("bob"));
  EXPECT_EQ(alice->client->connected_peer_count(), 0u);
}

TEST_F(PeerDiscoveryClientTest, StalledHandshakeReportsFailure) {
  TestPeer* alice = AddPeer(Options("alice"));
  alice->transports->options().never_open = true;
  ASSERT_TRUE(Start(alice));
  ASSERT_TRUE(WaitFor([&] { return alice->start_done; }));
  TestPeer* bob = AddPeer(Options("bob"));
  bob->transports->options().never_open = true;
  ASSERT_TRUE(Start(bob));

  ASSERT_TRUE(WaitFor([&] {
    return alice->count(DiscoveryEventType::kPeerFailed) > 0 &&
           bob->count(DiscoveryEventType::kPeerFailed) > 0;
  }));
  EXPECT_EQ(alice->last(DiscoveryEventType::kPeerFailed).peer_id, "bob");
  EXPECT_EQ(alice->last(DiscoveryEventType::kPeerFailed).error.type,
            SwarmErrorType::kNegotiationTimeout);
  EXPECT_EQ(bob->last(DiscoveryEventType::kPeerFailed).peer_id, "alice");
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerConnected), 0u);
  EXPECT_FALSE(alice->client->IsConnectedTo("bob"));
}

TEST_F(PeerDiscoveryClientTest, DuplicateChannelOpenReportsOnce) {
  TestPeer* alice = AddPeer(Options("alice"));
  alice->transports->options().double_open = true;
  ASSERT_TRUE(Start(alice));
  TestPeer* bob = AddPeer(Options("bob"));
  bob->transports->options().double_open = true;
  ASSERT_TRUE(Start(bob));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));
  RunFor(100);
  EXPECT_EQ(alice->count(DiscoveryEventType::kPeerConnected), 1u);
  EXPECT_EQ(bob->count(DiscoveryEventType::kPeerConnected), 1u);
}

TEST_F(PeerDiscoveryClientTest, StopReleasesRelaysAndKeepsConnectedSessions) {
  TestPeer* alice = StartPeer(Options("alice"));
  TestPeer* bob = StartPeer(Options("bob"));
  ASSERT_TRUE(WaitFor([&] { return Connected(alice, bob); }));
  std::shared_ptr<PeerSession> to_bob = alice->session();

  alice->client->Stop();
  EXPECT_FALSE(alice->client->ready());
  EXPECT_EQ(alice->client->relay_count(), 0u);
  EXPECT_EQ(alice->client->outstanding_offer_count(), 0u);
  EXPECT_EQ(relay_a_->open_channels(), 1u);
  EXPECT_EQ(to_bob->state(), PeerSession::State::kConnected);

  size_t errors = alice->count(DiscoveryEventType::kError);
  RunFor(100);
  EXPECT_EQ(alice->count(DiscoveryEventType::kError), errors);
  EXPECT_EQ(alice->count(DiscoveryEventType::kClosed), 0u);
  EXPECT_TRUE(to_bob->Send("still here"));
}
