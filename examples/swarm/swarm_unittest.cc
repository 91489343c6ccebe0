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

#include "swarm.h"

#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <vector>

TEST(Swarm, ErrorHelpers) {
  EXPECT_TRUE(SwarmError::None().ok());
  SwarmError error = SwarmError::Make(SwarmErrorType::kStaleResponse, "late");
  EXPECT_FALSE(error.ok());
  EXPECT_EQ(error.message, "late");
  EXPECT_STREQ(SwarmErrorTypeToString(error.type), "stale-response");
  EXPECT_STREQ(SwarmErrorTypeToString(SwarmErrorType::kRelayUnreachable),
               "relay-unreachable");
}

TEST(Swarm, SignalMessageFactories) {
  SignalMessage offer = SignalMessage::Offer("v=0");
  EXPECT_EQ(offer.type, SignalMessage::Type::kOffer);
  EXPECT_EQ(offer.sdp, "v=0");
  EXPECT_STREQ(SignalTypeToString(SignalMessage::Answer("").type), "answer");

  IceCandidate candidate;
  candidate.candidate = "candidate:1";
  SignalMessage trickle = SignalMessage::Candidate(candidate);
  EXPECT_EQ(trickle.type, SignalMessage::Type::kCandidate);
  EXPECT_EQ(trickle.candidate.candidate, "candidate:1");
}

TEST(Swarm, FormatLogRecordIsOneJsonLine) {
  LogRecord record;
  record.severity = rtc::LS_WARNING;
  record.message = "relay \"a\" down\nretrying";
  std::string line = SwarmFormatLogRecord(record);
  EXPECT_EQ(line.find('\n'), std::string::npos);

  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  ASSERT_TRUE(reader->parse(line.data(), line.data() + line.size(), &parsed, &errors));
  EXPECT_EQ(parsed["severity"].asString(), "warning");
  EXPECT_EQ(parsed["message"].asString(), record.message);
}

TEST(Swarm, StructuredSinkReceivesLogLines) {
  std::vector<LogRecord> records;
  StructuredLogSink sink([&records](const LogRecord& record) { records.push_back(record); });
  SwarmAddLogSink(&sink, rtc::LS_INFO);

  RTC_LOG(LS_WARNING) << "structured sink check";
  RTC_LOG(LS_VERBOSE) << "below the sink threshold";

  SwarmRemoveLogSink(&sink);
  RTC_LOG(LS_WARNING) << "after removal";

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].severity, rtc::LS_WARNING);
  EXPECT_NE(records[0].message.find("structured sink check"), std::string::npos);
  EXPECT_NE(records[0].message.back(), '\n');
}
