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

#include "peer_session.h"

#include <gtest/gtest.h>

#include <rtc_base/thread.h>

#include "fake_peer_transport.h"
#include "test_helpers.h"

namespace {

// Everything one session emitted.
struct Recorder {
  std::vector<SignalMessage> signals;
  std::vector<std::string> data;
  std::vector<SwarmError> errors;
  int connects = 0;
  int closes = 0;

  void Attach(PeerSession* session) {
    session->AddHandler(SessionEventType::kSignal, [this](const SessionEvent& e) {
      signals.push_back(e.signal);
    });
    session->AddHandler(SessionEventType::kData,
                        [this](const SessionEvent& e) { data.push_back(e.data); });
    session->AddHandler(SessionEventType::kError,
                        [this](const SessionEvent& e) { errors.push_back(e.error); });
    session->AddHandler(SessionEventType::kConnect,
                        [this](const SessionEvent&) { ++connects; });
    session->AddHandler(SessionEventType::kClose,
                        [this](const SessionEvent&) { ++closes; });
  }
};

}  // namespace

class PeerSessionTest : public ::testing::Test {
 protected:
  PeerSessionTest() : factory_(&network_) {}

  std::shared_ptr<PeerSession> CreateSession(bool initiator,
                                             Recorder* recorder,
                                             bool trickle = false) {
    PeerSession::Config config;
    config.initiator = initiator;
    config.trickle = trickle;
    config.ice_gathering_timeout = webrtc::TimeDelta::Millis(100);
    config.negotiation_timeout = webrtc::TimeDelta::Millis(300);
    config.max_pending_candidates = 2;
    config.local_peer_id = initiator ? "alice" : "bob";
    std::shared_ptr<PeerSession> session =
        PeerSession::Create(factory_.Create(initiator), config);
    recorder->Attach(session.get());
    return session;
  }

  FakePeerTransport* LastTransport() {
    return network_.Find(factory_.created_ids().back());
  }

  // Relays every description between the two sessions.
  void Wire(PeerSession* a, PeerSession* b) {
    a->AddHandler(SessionEventType::kSignal,
                  [b](const SessionEvent& e) { b->Signal(e.signal); });
    b->AddHandler(SessionEventType::kSignal,
                  [a](const SessionEvent& e) { a->Signal(e.signal); });
  }

  static IceCandidate Candidate(int n) {
    IceCandidate candidate;
    candidate.sdp_mid = "0";
    candidate.candidate = "candidate:" + std::to_string(n) + " 1 udp 1 10.0.0.1 9 typ host";
    return candidate;
  }

  rtc::AutoThread main_thread_;
  FakeTransportNetwork network_;
  FakePeerTransportFactory factory_;
};

TEST_F(PeerSessionTest, CreateRequiresTransport) {
  EXPECT_EQ(PeerSession::Create(nullptr, PeerSession::Config()), nullptr);
}

TEST_F(PeerSessionTest, InitiatorEmitsOfferAfterGathering) {
  Recorder rec;
  auto session = CreateSession(true, &rec);
  EXPECT_EQ(session->state(), PeerSession::State::kNew);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }));
  EXPECT_EQ(rec.signals[0].type, SignalMessage::Type::kOffer);
  EXPECT_NE(rec.signals[0].sdp.find("+candidates"), std::string::npos);
  EXPECT_EQ(session->state(), PeerSession::State::kLocalOfferSent);

  // A second Start is a no-op.
  session->Start();
  RunFor(50);
  EXPECT_EQ(rec.signals.size(), 1u);
}

TEST_F(PeerSessionTest, ResponderIgnoresStart) {
  Recorder rec;
  auto session = CreateSession(false, &rec);
  session->Start();
  RunFor(50);
  EXPECT_TRUE(rec.signals.empty());
  EXPECT_EQ(session->state(), PeerSession::State::kNew);
}

TEST_F(PeerSessionTest, FullHandshakeAndData) {
  Recorder alice_rec, bob_rec;
  auto alice = CreateSession(true, &alice_rec);
  auto bob = CreateSession(false, &bob_rec);
  Wire(alice.get(), bob.get());

  alice->Start();
  ASSERT_TRUE(WaitFor([&] { return alice_rec.connects == 1 && bob_rec.connects == 1; }));
  EXPECT_EQ(alice->state(), PeerSession::State::kConnected);
  EXPECT_EQ(bob->state(), PeerSession::State::kConnected);
  ASSERT_EQ(bob_rec.signals.size(), 1u);
  EXPECT_EQ(bob_rec.signals[0].type, SignalMessage::Type::kAnswer);

  EXPECT_TRUE(alice->Send("hello"));
  EXPECT_TRUE(bob->Send("hi"));
  ASSERT_TRUE(WaitFor([&] { return !alice_rec.data.empty() && !bob_rec.data.empty(); }));
  EXPECT_EQ(bob_rec.data[0], "hello");
  EXPECT_EQ(alice_rec.data[0], "hi");

  // The handshake timer must not fire on a connected session.
  RunFor(400);
  EXPECT_TRUE(alice_rec.errors.empty());
  EXPECT_TRUE(bob_rec.errors.empty());
}

TEST_F(PeerSessionTest, PartialOfferAfterGatheringTimeout) {
  factory_.options().never_complete_gathering = true;
  Recorder rec;
  auto session = CreateSession(true, &rec);
  session->Start();
  RunFor(30);
  EXPECT_TRUE(rec.signals.empty());
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }, 1000));
  EXPECT_EQ(rec.signals[0].sdp.find("+candidates"), std::string::npos);
  EXPECT_EQ(session->state(), PeerSession::State::kLocalOfferSent);
}

TEST_F(PeerSessionTest, OfferFailureFailsSession) {
  factory_.options().fail_create_offer = true;
  Recorder rec;
  auto session = CreateSession(true, &rec);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return !rec.errors.empty(); }));
  EXPECT_EQ(rec.errors[0].type, SwarmErrorType::kNegotiationFailure);
  EXPECT_EQ(session->state(), PeerSession::State::kFailed);
  EXPECT_EQ(rec.closes, 0);
  // Terminal sessions ignore Close.
  session->Close();
  EXPECT_EQ(rec.closes, 0);
}

TEST_F(PeerSessionTest, RejectedRemoteOfferFailsResponder) {
  factory_.options().fail_set_remote = true;
  Recorder rec;
  auto session = CreateSession(false, &rec);
  session->Signal(SignalMessage::Offer("fake-offer:99"));
  EXPECT_EQ(session->state(), PeerSession::State::kRemoteOfferReceived);
  ASSERT_TRUE(WaitFor([&] { return !rec.errors.empty(); }));
  EXPECT_EQ(session->state(), PeerSession::State::kFailed);
  EXPECT_TRUE(rec.signals.empty());
}

TEST_F(PeerSessionTest, RejectedRemoteAnswerFailsInitiator) {
  factory_.options().fail_set_remote = true;
  Recorder rec;
  auto session = CreateSession(true, &rec);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }));
  EXPECT_EQ(session->state(), PeerSession::State::kLocalOfferSent);

  session->Signal(SignalMessage::Answer("fake-answer:99"));
  ASSERT_TRUE(WaitFor([&] { return !rec.errors.empty(); }));
  EXPECT_EQ(rec.errors[0].type, SwarmErrorType::kNegotiationFailure);
  EXPECT_EQ(session->state(), PeerSession::State::kFailed);
  EXPECT_EQ(rec.connects, 0);
  EXPECT_EQ(network_.links(), 0);
  EXPECT_TRUE(LastTransport()->closed());
}

TEST_F(PeerSessionTest, HandshakeTimesOut) {
  factory_.options().never_open = true;
  Recorder alice_rec, bob_rec;
  auto alice = CreateSession(true, &alice_rec);
  auto bob = CreateSession(false, &bob_rec);
  Wire(alice.get(), bob.get());

  alice->Start();
  ASSERT_TRUE(WaitFor([&] { return !bob_rec.signals.empty(); }));
  EXPECT_EQ(bob->state(), PeerSession::State::kLocalAnswerSent);
  ASSERT_TRUE(WaitFor(
      [&] { return !alice_rec.errors.empty() && !bob_rec.errors.empty(); }, 2000));
  EXPECT_EQ(alice_rec.errors[0].type, SwarmErrorType::kNegotiationTimeout);
  EXPECT_EQ(bob_rec.errors[0].type, SwarmErrorType::kNegotiationTimeout);
  EXPECT_EQ(alice_rec.connects, 0);
}

TEST_F(PeerSessionTest, EarlyCandidatesAreBoundedAndDrained) {
  Recorder rec;
  auto session = CreateSession(false, &rec);
  FakePeerTransport* transport = LastTransport();
  session->Signal(SignalMessage::Candidate(Candidate(1)));
  session->Signal(SignalMessage::Candidate(Candidate(2)));
  session->Signal(SignalMessage::Candidate(Candidate(3)));
  EXPECT_EQ(session->pending_candidate_count(), 2u);
  EXPECT_TRUE(transport->added_candidates().empty());

  session->Signal(SignalMessage::Offer("fake-offer:99"));
  ASSERT_TRUE(WaitFor([&] { return transport->added_candidates().size() == 2u; }));
  EXPECT_EQ(session->pending_candidate_count(), 0u);
  EXPECT_EQ(transport->added_candidates()[0].candidate, Candidate(1).candidate);

  // After the remote description candidates go straight through.
  session->Signal(SignalMessage::Candidate(Candidate(4)));
  EXPECT_EQ(transport->added_candidates().size(), 3u);
}

TEST_F(PeerSessionTest, BadCandidateIsNotFatal) {
  factory_.options().fail_add_candidate = true;
  Recorder rec;
  auto session = CreateSession(false, &rec);
  session->Signal(SignalMessage::Offer("fake-offer:99"));
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }));
  session->Signal(SignalMessage::Candidate(Candidate(1)));
  EXPECT_TRUE(rec.errors.empty());
  EXPECT_EQ(session->state(), PeerSession::State::kLocalAnswerSent);
}

TEST_F(PeerSessionTest, OutOfOrderDescriptionsAreIgnored) {
  Recorder alice_rec, bob_rec;
  auto alice = CreateSession(true, &alice_rec);
  auto bob = CreateSession(false, &bob_rec);

  // Answer before any offer went out.
  alice->Signal(SignalMessage::Answer("fake-answer:99"));
  // Offer to an initiator, answer to a responder.
  alice->Signal(SignalMessage::Offer("fake-offer:99"));
  bob->Signal(SignalMessage::Answer("fake-answer:99"));
  RunFor(50);
  EXPECT_EQ(alice->state(), PeerSession::State::kNew);
  EXPECT_EQ(bob->state(), PeerSession::State::kNew);
  EXPECT_TRUE(alice_rec.errors.empty());
  EXPECT_TRUE(bob_rec.errors.empty());

  // A second offer to a responder is ignored too.
  bob->Signal(SignalMessage::Offer("fake-offer:98"));
  bob->Signal(SignalMessage::Offer("fake-offer:97"));
  ASSERT_TRUE(WaitFor([&] { return !bob_rec.signals.empty(); }));
  RunFor(50);
  EXPECT_EQ(bob_rec.signals.size(), 1u);
}

TEST_F(PeerSessionTest, DuplicateOpenConnectsOnce) {
  factory_.options().double_open = true;
  Recorder alice_rec, bob_rec;
  auto alice = CreateSession(true, &alice_rec);
  auto bob = CreateSession(false, &bob_rec);
  Wire(alice.get(), bob.get());
  alice->Start();
  ASSERT_TRUE(WaitFor([&] { return alice_rec.connects == 1 && bob_rec.connects == 1; }));
  RunFor(50);
  EXPECT_EQ(alice_rec.connects, 1);
  EXPECT_EQ(bob_rec.connects, 1);
}

TEST_F(PeerSessionTest, CloseIsIdempotentAndNotifiesRemote) {
  Recorder alice_rec, bob_rec;
  auto alice = CreateSession(true, &alice_rec);
  auto bob = CreateSession(false, &bob_rec);
  Wire(alice.get(), bob.get());
  alice->Start();
  ASSERT_TRUE(WaitFor([&] { return alice_rec.connects == 1 && bob_rec.connects == 1; }));

  alice->Close();
  alice->Close();
  EXPECT_EQ(alice_rec.closes, 1);
  EXPECT_EQ(alice->state(), PeerSession::State::kClosed);
  EXPECT_FALSE(alice->Send("late"));

  ASSERT_TRUE(WaitFor([&] { return bob_rec.closes == 1; }));
  EXPECT_EQ(bob->state(), PeerSession::State::kClosed);
  EXPECT_TRUE(bob_rec.errors.empty());
}

TEST_F(PeerSessionTest, SendBeforeConnectFails) {
  Recorder rec;
  auto session = CreateSession(true, &rec);
  EXPECT_FALSE(session->Send("too early"));
}

TEST_F(PeerSessionTest, ChannelErrorFailsSession) {
  Recorder rec;
  auto session = CreateSession(false, &rec);
  FakePeerTransport* transport = LastTransport();
  session->Signal(SignalMessage::Offer("fake-offer:99"));
  transport->InjectError("ice failed");
  ASSERT_TRUE(WaitFor([&] { return !rec.errors.empty(); }));
  EXPECT_EQ(rec.errors[0].message, "ice failed");
  EXPECT_EQ(session->state(), PeerSession::State::kFailed);
}

TEST_F(PeerSessionTest, TrickleEmitsCandidatesAfterDescription) {
  factory_.options().local_candidates = 2;
  Recorder rec;
  auto session = CreateSession(true, &rec, /*trickle=*/true);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return rec.signals.size() == 3u; }));
  EXPECT_EQ(rec.signals[0].type, SignalMessage::Type::kOffer);
  EXPECT_EQ(rec.signals[1].type, SignalMessage::Type::kCandidate);
  EXPECT_EQ(rec.signals[2].type, SignalMessage::Type::kCandidate);
}

TEST_F(PeerSessionTest, NonTrickleKeepsCandidatesInDescription) {
  factory_.options().local_candidates = 2;
  Recorder rec;
  auto session = CreateSession(true, &rec);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }));
  RunFor(50);
  ASSERT_EQ(rec.signals.size(), 1u);
  EXPECT_EQ(rec.signals[0].type, SignalMessage::Type::kOffer);
}

TEST_F(PeerSessionTest, DestroyingSessionClosesTransportSilently) {
  Recorder rec;
  auto session = CreateSession(true, &rec);
  session->Start();
  ASSERT_TRUE(WaitFor([&] { return !rec.signals.empty(); }));
  int transports = network_.transport_count();
  session.reset();
  EXPECT_EQ(network_.transport_count(), transports - 1);
  RunFor(20);
  EXPECT_EQ(rec.closes, 0);
}
