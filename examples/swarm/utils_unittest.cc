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

#include "utils.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <set>

TEST(SwarmUtils, OfferIdIsFortyLowercaseHexChars) {
  std::set<std::string> seen;
  for (int i = 0; i < 10000; ++i) {
    std::string id = SwarmCreateOfferId();
    ASSERT_EQ(id.size(), 2 * kSwarmOfferIdBytes);
    ASSERT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 10000u);
}

TEST(SwarmUtils, PeerIdHasPrefixAndBase36Suffix) {
  std::string id = SwarmCreatePeerId();
  ASSERT_EQ(id.size(), 14u);
  EXPECT_EQ(id.substr(0, 5), "peer_");
  for (char c : id.substr(5)) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')) << id;
  }
  EXPECT_NE(SwarmCreatePeerId(), SwarmCreatePeerId());
}

TEST(SwarmUtils, InfoHashIsSha1OfTopic) {
  EXPECT_EQ(SwarmInfoHashFromTopic("abc"),
            "a9993e364706816aba3e25717850c26c9cd0d89d");
  EXPECT_EQ(SwarmInfoHashFromTopic(""),
            "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(SwarmUtils, ParseRelayUrl) {
  RelayUrl url;
  ASSERT_TRUE(ParseRelayUrl("wss://tracker.example.com/announce", &url));
  EXPECT_TRUE(url.secure);
  EXPECT_EQ(url.host, "tracker.example.com");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.path, "/announce");

  ASSERT_TRUE(ParseRelayUrl("ws://localhost:8000", &url));
  EXPECT_FALSE(url.secure);
  EXPECT_EQ(url.host, "localhost");
  EXPECT_EQ(url.port, "8000");
  EXPECT_EQ(url.path, "/");

  EXPECT_FALSE(ParseRelayUrl("http://tracker.example.com/", &url));
  EXPECT_FALSE(ParseRelayUrl("wss://:443/", &url));
  EXPECT_FALSE(ParseRelayUrl("wss://host:99999/", &url));
  EXPECT_FALSE(ParseRelayUrl("wss://host:port/", &url));
  EXPECT_TRUE(ParseRelayUrl("ws://host/", nullptr));
}

TEST(SwarmUtils, ParseRelayListSkipsCommentsDuplicatesAndOtherSchemes) {
  std::vector<std::string> urls = ParseRelayList(
      "# trackers\n"
      "wss://a.example/\n"
      "\n"
      "   ws://b.example:8000/   \n"
      "udp://tracker.example:1337\n"
      "wss://a.example/\n");
  ASSERT_EQ(urls.size(), 2u);
  EXPECT_EQ(urls[0], "wss://a.example/");
  EXPECT_EQ(urls[1], "ws://b.example:8000/");
}

TEST(SwarmUtils, LoadRelayList) {
  std::string path = testing::TempDir() + "swarm_relays.txt";
  {
    std::ofstream out(path);
    out << "wss://one.example/\nwss://two.example/\n";
  }
  std::vector<std::string> urls;
  ASSERT_TRUE(SwarmLoadRelayList(path, &urls));
  EXPECT_EQ(urls.size(), 2u);
  std::remove(path.c_str());

  EXPECT_FALSE(SwarmLoadRelayList(path, &urls));
}

TEST(SwarmUtils, DefaultRelaysAreSecureWebSockets) {
  std::vector<std::string> urls = SwarmDefaultRelayUrls();
  ASSERT_FALSE(urls.empty());
  for (const auto& url : urls) {
    RelayUrl parsed;
    EXPECT_TRUE(ParseRelayUrl(url, &parsed)) << url;
    EXPECT_TRUE(parsed.secure) << url;
  }
}

TEST(SwarmUtils, AnnounceIntervalGrowsUpToCap) {
  EXPECT_DOUBLE_EQ(SwarmNextAnnounceIntervalMs(5000, 1.1, 120000), 5500);
  EXPECT_DOUBLE_EQ(SwarmNextAnnounceIntervalMs(119000, 1.1, 120000), 120000);
  EXPECT_DOUBLE_EQ(SwarmNextAnnounceIntervalMs(120000, 1.1, 120000), 120000);

  double interval = 5000;
  for (int i = 0; i < 100; ++i) {
    double next = SwarmNextAnnounceIntervalMs(interval, 1.1, 120000);
    EXPECT_GE(next, interval);
    EXPECT_LE(next, 120000);
    interval = next;
  }
  EXPECT_DOUBLE_EQ(interval, 120000);
}

TEST(SwarmUtils, StringSplit) {
  std::vector<std::string> parts = stringSplit("a,b,,c", ",");
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(parts[3], "c");
}
