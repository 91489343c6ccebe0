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

#include "tracker.h"

#include <gtest/gtest.h>

#include <rtc_base/thread.h>

#include "fake_relay.h"
#include "status.h"
#include "test_helpers.h"

namespace {

Json::Value Parse(const std::string& text) {
  Json::Value value;
  std::string error;
  EXPECT_TRUE(ParseRelayMessage(text, &value, &error)) << error;
  return value;
}

}  // namespace

TEST(TrackerCodec, ClassifiesInPriorityOrder) {
  EXPECT_EQ(ClassifyRelayMessage(Parse(
                R"({"action":"announce","peer_id":"p","offer":{},"offer_id":"o"})")),
            RelayMessageKind::kOffer);
  EXPECT_EQ(ClassifyRelayMessage(Parse(
                R"({"action":"announce","peer_id":"p","answer":{},"offer_id":"o"})")),
            RelayMessageKind::kAnswer);
  EXPECT_EQ(ClassifyRelayMessage(Parse(R"({"failure reason":"banned"})")),
            RelayMessageKind::kFailure);
  EXPECT_EQ(ClassifyRelayMessage(
                Parse(R"({"action":"announce","complete":1,"incomplete":2})")),
            RelayMessageKind::kStats);
  EXPECT_EQ(ClassifyRelayMessage(Parse(R"({"action":"scrape","files":{}})")),
            RelayMessageKind::kScrape);
  EXPECT_EQ(ClassifyRelayMessage(Parse(R"({"hello":"world"})")),
            RelayMessageKind::kUnknown);
  // An offer without a sender is not routable.
  EXPECT_EQ(ClassifyRelayMessage(Parse(R"({"action":"announce","offer":{}})")),
            RelayMessageKind::kStats);
  EXPECT_EQ(ClassifyRelayMessage(Json::Value(Json::arrayValue)),
            RelayMessageKind::kUnknown);
}

TEST(TrackerCodec, RejectsNonObjects) {
  Json::Value value;
  std::string error;
  EXPECT_FALSE(ParseRelayMessage("not json at all", &value, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(ParseRelayMessage("[1,2,3]", &value, &error));
  EXPECT_FALSE(ParseRelayMessage("\"text\"", &value, nullptr));
}

TEST(TrackerCodec, BuildAnnounce) {
  Json::Value plain = BuildAnnounce("hash", "me", 50, {});
  EXPECT_EQ(plain[Tracker::kAction].asString(), "announce");
  EXPECT_EQ(plain[Tracker::kInfoHash].asString(), "hash");
  EXPECT_EQ(plain[Tracker::kPeerId].asString(), "me");
  EXPECT_EQ(plain[Tracker::kNumWant].asInt(), 50);
  EXPECT_FALSE(plain.isMember(Tracker::kOffers));

  Json::Value with_offer = BuildAnnounce("hash", "me", 5, {OfferEntry{"id1", "v=0"}});
  ASSERT_TRUE(with_offer[Tracker::kOffers].isArray());
  ASSERT_EQ(with_offer[Tracker::kOffers].size(), 1u);
  const Json::Value& entry = with_offer[Tracker::kOffers][0];
  EXPECT_EQ(entry[Tracker::kOfferId].asString(), "id1");
  EXPECT_EQ(entry[Tracker::kOffer]["type"].asString(), "offer");
  EXPECT_EQ(entry[Tracker::kOffer]["sdp"].asString(), "v=0");
}

TEST(TrackerCodec, BuildAnswer) {
  Json::Value answer = BuildAnswer("hash", "me", "them", "id1", "v=0 answer");
  EXPECT_EQ(answer[Tracker::kAction].asString(), "announce");
  EXPECT_EQ(answer[Tracker::kToPeerId].asString(), "them");
  EXPECT_EQ(answer[Tracker::kOfferId].asString(), "id1");
  EXPECT_EQ(answer[Tracker::kAnswer]["type"].asString(), "answer");
  EXPECT_EQ(ClassifyRelayMessage(answer), RelayMessageKind::kAnswer);
}

TEST(TrackerCodec, SignalMessageJson) {
  IceCandidate candidate;
  candidate.sdp_mid = "0";
  candidate.sdp_mline_index = 1;
  candidate.candidate = "candidate:1 1 udp 1 10.0.0.1 9 typ host";
  Json::Value json = SignalMessageToJson(SignalMessage::Candidate(candidate));
  EXPECT_EQ(json["type"].asString(), "candidate");
  EXPECT_EQ(json["candidate"]["sdpMid"].asString(), "0");
  EXPECT_EQ(json["candidate"]["sdpMLineIndex"].asInt(), 1);

  SignalMessage parsed;
  ASSERT_TRUE(SignalMessageFromJson(json, &parsed));
  EXPECT_EQ(parsed.type, SignalMessage::Type::kCandidate);
  EXPECT_EQ(parsed.candidate.candidate, candidate.candidate);

  EXPECT_FALSE(SignalMessageFromJson(Parse(R"({"type":"offer"})"), &parsed));
  EXPECT_FALSE(SignalMessageFromJson(Parse(R"({"type":"pranswer","sdp":"x"})"), &parsed));
  EXPECT_FALSE(SignalMessageFromJson(Parse(R"({"sdp":"x"})"), &parsed));
}

TEST(TrackerCodec, WriteIsSingleLine) {
  std::string text = WriteRelayMessage(BuildAnnounce("h", "p", 1, {OfferEntry{"o", "a\nb"}}));
  EXPECT_EQ(text.find('\n'), std::string::npos);
  Json::Value back = Parse(text);
  EXPECT_EQ(back[Tracker::kOffers][0][Tracker::kOffer]["sdp"].asString(), "a\nb");
}

class TrackerConnectionTest : public ::testing::Test {
 protected:
  TrackerConnectionTest() { relay_ = factory_.AddRelay("ws://relay.test/"); }

  std::unique_ptr<TrackerConnection> Connect(double initial, double max, double mult) {
    std::unique_ptr<RelayChannel> channel = factory_.Create("ws://relay.test/");
    bool connected = false;
    channel->Connect(webrtc::TimeDelta::Millis(500),
                     [&connected](bool ok, const std::string&) { connected = ok; });
    EXPECT_TRUE(WaitFor([&] { return connected; }));
    return std::make_unique<TrackerConnection>(std::move(channel), initial, max, mult);
  }

  rtc::AutoThread main_thread_;
  FakeRelayFactory factory_;
  FakeRelay* relay_ = nullptr;
};

TEST_F(TrackerConnectionTest, IntervalBacksOffToCap) {
  auto tracker = Connect(1000, 1500, 1.2);
  EXPECT_DOUBLE_EQ(tracker->current_interval_ms(), 1000);
  EXPECT_EQ(tracker->RecordScheduledAnnounce().ms(), 1200);
  EXPECT_EQ(tracker->RecordScheduledAnnounce().ms(), 1440);
  EXPECT_EQ(tracker->RecordScheduledAnnounce().ms(), 1500);
  EXPECT_EQ(tracker->RecordScheduledAnnounce().ms(), 1500);
  EXPECT_EQ(tracker->announce_count(), 4);
}

TEST_F(TrackerConnectionTest, ScheduledAnnouncesFireAndStop) {
  auto tracker = Connect(20, 40, 2.0);
  int fired = 0;
  tracker->StartAnnouncing(rtc::Thread::Current(),
                           [&fired](TrackerConnection*) { ++fired; });
  EXPECT_TRUE(tracker->announcing());
  ASSERT_TRUE(WaitFor([&] { return fired >= 3; }));
  EXPECT_DOUBLE_EQ(tracker->current_interval_ms(), 40);

  tracker->StopAnnouncing();
  EXPECT_FALSE(tracker->announcing());
  int stopped_at = fired;
  RunFor(100);
  EXPECT_EQ(fired, stopped_at);
}

TEST_F(TrackerConnectionTest, SendReachesRelayUntilClosed) {
  auto tracker = Connect(1000, 1000, 1.0);
  EXPECT_TRUE(tracker->Send(BuildAnnounce("hash", "me", 10, {})));
  ASSERT_EQ(relay_->received().size(), 1u);
  EXPECT_EQ(relay_->announces_from("me"), 1);

  tracker->channel()->Close();
  EXPECT_FALSE(tracker->Send(BuildAnnounce("hash", "me", 10, {})));
  EXPECT_EQ(relay_->received().size(), 1u);
}
