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

#include "wsock.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(WebSocketClient, Base64) {
  EXPECT_EQ(WebSocketClient::base64_encode(""), "");
  EXPECT_EQ(WebSocketClient::base64_encode("f"), "Zg==");
  EXPECT_EQ(WebSocketClient::base64_encode("fo"), "Zm8=");
  EXPECT_EQ(WebSocketClient::base64_encode("foo"), "Zm9v");
  EXPECT_EQ(WebSocketClient::base64_encode("foobar"), "Zm9vYmFy");
}

TEST(WebSocketClient, KeyIsSixteenBytesBase64) {
  std::string key = WebSocketClient::generate_websocket_key();
  EXPECT_EQ(key.size(), 24u);
  EXPECT_EQ(key.substr(22), "==");
  EXPECT_NE(key, WebSocketClient::generate_websocket_key());
}

TEST(WebSocketClient, UnmaskedFrameLayout) {
  std::string frame = WebSocketClient::encode_frame(WebSocketClient::kText, "hi", false);
  ASSERT_EQ(frame.size(), 4u);
  EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0x81);
  EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0x02);
  EXPECT_EQ(frame.substr(2), "hi");
}

TEST(WebSocketClient, MaskedFrameDecodesToPayload) {
  std::string payload(300, 'x');
  std::string frame = WebSocketClient::encode_frame(WebSocketClient::kText, payload, true);
  EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0x80 | 126);
  EXPECT_EQ(frame.size(), 4u + 4u + payload.size());

  std::vector<WebSocketClient::Frame> frames;
  ASSERT_TRUE(WebSocketClient::decode_frames(&frame, &frames));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].opcode, WebSocketClient::kText);
  EXPECT_TRUE(frames[0].fin);
  EXPECT_EQ(frames[0].payload, payload);
  EXPECT_TRUE(frame.empty());
}

TEST(WebSocketClient, LargeFrameUsesSixtyFourBitLength) {
  std::string payload(70000, 'y');
  std::string frame = WebSocketClient::encode_frame(WebSocketClient::kBinary, payload, false);
  EXPECT_EQ(static_cast<uint8_t>(frame[1]), 127);
  std::vector<WebSocketClient::Frame> frames;
  ASSERT_TRUE(WebSocketClient::decode_frames(&frame, &frames));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload.size(), payload.size());
}

TEST(WebSocketClient, PartialFramesStayBuffered) {
  std::string first = WebSocketClient::encode_frame(WebSocketClient::kText, "one", false);
  std::string second = WebSocketClient::encode_frame(WebSocketClient::kPing, "", false);
  std::string buffer = first + second.substr(0, 1);

  std::vector<WebSocketClient::Frame> frames;
  ASSERT_TRUE(WebSocketClient::decode_frames(&buffer, &frames));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].payload, "one");
  EXPECT_EQ(buffer.size(), 1u);

  buffer += second.substr(1);
  frames.clear();
  ASSERT_TRUE(WebSocketClient::decode_frames(&buffer, &frames));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].opcode, WebSocketClient::kPing);
  EXPECT_TRUE(buffer.empty());
}

TEST(WebSocketClient, RejectsReservedBitsAndOpcodes) {
  std::string reserved_bits("\xC1\x00", 2);
  std::vector<WebSocketClient::Frame> frames;
  EXPECT_FALSE(WebSocketClient::decode_frames(&reserved_bits, &frames));
  EXPECT_EQ(reserved_bits.size(), 2u);

  std::string reserved_opcode("\x83\x00", 2);
  EXPECT_FALSE(WebSocketClient::decode_frames(&reserved_opcode, &frames));
  EXPECT_TRUE(frames.empty());
}

TEST(WebSocketClient, RejectsOversizedFrame) {
  std::string header("\x81\x7F", 2);
  // 1 GiB announced length.
  header += std::string("\x00\x00\x00\x00\x40\x00\x00\x00", 8);
  std::vector<WebSocketClient::Frame> frames;
  EXPECT_FALSE(WebSocketClient::decode_frames(&header, &frames));
}

namespace {

WebSocketClient::Frame DataFrame(uint8_t opcode, const std::string& payload, bool fin) {
  WebSocketClient::Frame frame;
  frame.opcode = opcode;
  frame.fin = fin;
  frame.payload = payload;
  return frame;
}

}  // namespace

TEST(WebSocketClient, ReassemblesFragmentedMessage) {
  std::string fragments;
  bool in_fragment = false;
  std::vector<std::string> messages;

  auto first = DataFrame(WebSocketClient::kText, "hel", false);
  auto middle = DataFrame(WebSocketClient::kContinuation, "lo ", false);
  auto last = DataFrame(WebSocketClient::kContinuation, "world", true);
  ASSERT_TRUE(WebSocketClient::reassemble(&first, &fragments, &in_fragment, &messages));
  ASSERT_TRUE(WebSocketClient::reassemble(&middle, &fragments, &in_fragment, &messages));
  EXPECT_TRUE(in_fragment);
  EXPECT_TRUE(messages.empty());
  ASSERT_TRUE(WebSocketClient::reassemble(&last, &fragments, &in_fragment, &messages));
  EXPECT_FALSE(in_fragment);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0], "hello world");

  // A stray continuation is dropped.
  auto stray = DataFrame(WebSocketClient::kContinuation, "x", true);
  EXPECT_TRUE(WebSocketClient::reassemble(&stray, &fragments, &in_fragment, &messages));
  EXPECT_EQ(messages.size(), 1u);
}

TEST(WebSocketClient, FragmentedMessageIsCapped) {
  std::string fragments;
  bool in_fragment = false;
  std::vector<std::string> messages;

  auto start = DataFrame(WebSocketClient::kBinary,
                         std::string(WebSocketClient::kMaxMessageSize - 1, 'a'), false);
  ASSERT_TRUE(WebSocketClient::reassemble(&start, &fragments, &in_fragment, &messages));
  auto fits = DataFrame(WebSocketClient::kContinuation, "b", false);
  ASSERT_TRUE(WebSocketClient::reassemble(&fits, &fragments, &in_fragment, &messages));
  EXPECT_EQ(fragments.size(), WebSocketClient::kMaxMessageSize);

  auto overflow = DataFrame(WebSocketClient::kContinuation, "c", true);
  EXPECT_FALSE(WebSocketClient::reassemble(&overflow, &fragments, &in_fragment, &messages));
  EXPECT_TRUE(messages.empty());
  EXPECT_EQ(fragments.size(), WebSocketClient::kMaxMessageSize);
}

TEST(WebSocketClient, NotConnectedByDefault) {
  WebSocketClient client;
  EXPECT_FALSE(client.is_connected());
  EXPECT_FALSE(client.send_message("nobody listening"));
}
