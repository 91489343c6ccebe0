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

#include "option.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "utils.h"

TEST(SwarmOptions, Defaults) {
  SwarmOptions opts = parseOptions(std::vector<std::string>());
  EXPECT_EQ(opts.topic, "swarm-lobby");
  EXPECT_EQ(opts.numwant, 50);
  EXPECT_EQ(opts.announce_interval_ms, 5000);
  EXPECT_EQ(opts.max_announce_interval_ms, 120000);
  EXPECT_DOUBLE_EQ(opts.backoff_multiplier, 1.1);
  EXPECT_EQ(opts.max_outstanding_offers, 1);
  EXPECT_EQ(opts.negotiation_timeout_ms, 30000);
  EXPECT_EQ(opts.ice_gathering_timeout_ms, 3000);
  EXPECT_EQ(opts.ice_servers.size(), 3u);
  EXPECT_TRUE(opts.relay_urls.empty());
  EXPECT_FALSE(opts.help);
  EXPECT_FALSE(opts.help_string.empty());
}

TEST(SwarmOptions, CommandLineValues) {
  SwarmOptions opts = parseOptions(
      "--topic=game --numwant=10 --backoff=1.5 "
      "--relay=wss://a.example/,wss://b.example/ --relay=ws://c.example:9000/ "
      "--ice_server=stun:stun.example:3478 --greeting=hi --verbose");
  EXPECT_EQ(opts.topic, "game");
  EXPECT_EQ(opts.numwant, 10);
  EXPECT_DOUBLE_EQ(opts.backoff_multiplier, 1.5);
  ASSERT_EQ(opts.relay_urls.size(), 3u);
  EXPECT_EQ(opts.relay_urls[2], "ws://c.example:9000/");
  ASSERT_EQ(opts.ice_servers.size(), 1u);
  EXPECT_EQ(opts.ice_servers[0], "stun:stun.example:3478");
  EXPECT_EQ(opts.greeting, "hi");
  EXPECT_TRUE(opts.verbose);
}

TEST(SwarmOptions, BadNumbersKeepDefaults) {
  SwarmOptions opts = parseOptions("--numwant=lots --backoff=fast --unknown=1");
  EXPECT_EQ(opts.numwant, 50);
  EXPECT_DOUBLE_EQ(opts.backoff_multiplier, 1.1);
}

TEST(SwarmOptions, HelpShortCircuits) {
  SwarmOptions opts = parseOptions("--topic=x --help");
  EXPECT_TRUE(opts.help);
}

TEST(SwarmOptions, ConfigJson) {
  SwarmOptions opts;
  applyConfigJson(
      R"({"topic": "from-config", "numwant": 7, "relay_urls": ["wss://r.example/", 3],
          "backoff_multiplier": 2, "announce_interval_ms": "soon",
          "log_json": true, "unknown_key": 1})",
      opts);
  EXPECT_EQ(opts.topic, "from-config");
  EXPECT_EQ(opts.numwant, 7);
  ASSERT_EQ(opts.relay_urls.size(), 1u);
  EXPECT_EQ(opts.relay_urls[0], "wss://r.example/");
  EXPECT_DOUBLE_EQ(opts.backoff_multiplier, 2.0);
  EXPECT_EQ(opts.announce_interval_ms, 5000);
  EXPECT_TRUE(opts.log_json);
}

TEST(SwarmOptions, MalformedConfigIsIgnored) {
  SwarmOptions opts;
  applyConfigJson("{not json", opts);
  EXPECT_EQ(opts.topic, "swarm-lobby");
  applyConfigJson("[1, 2]", opts);
  EXPECT_EQ(opts.numwant, 50);
}

TEST(SwarmOptions, CommandLineOverridesConfigFile) {
  std::string path = testing::TempDir() + "swarm_options.json";
  {
    std::ofstream out(path);
    out << R"({"topic": "file-topic", "numwant": 3})";
  }
  SwarmOptions opts = parseOptions({"--config", path, "--numwant=9"});
  EXPECT_EQ(opts.config_path, path);
  EXPECT_EQ(opts.topic, "file-topic");
  EXPECT_EQ(opts.numwant, 9);
  std::remove(path.c_str());
}

TEST(SwarmOptions, ResolveFillsIdentityAndRelays) {
  SwarmOptions opts;
  opts.topic = "abc";
  SwarmResolveOptions(&opts);
  EXPECT_EQ(opts.info_hash, SwarmInfoHashFromTopic("abc"));
  EXPECT_EQ(opts.peer_id.substr(0, 5), "peer_");
  EXPECT_EQ(opts.relay_urls, SwarmDefaultRelayUrls());

  SwarmOptions explicit_opts;
  explicit_opts.info_hash = "00ff";
  explicit_opts.peer_id = "me";
  explicit_opts.relay_urls = {"ws://localhost:8000/"};
  SwarmResolveOptions(&explicit_opts);
  EXPECT_EQ(explicit_opts.info_hash, "00ff");
  EXPECT_EQ(explicit_opts.peer_id, "me");
  ASSERT_EQ(explicit_opts.relay_urls.size(), 1u);
}

TEST(SwarmOptions, ResolveReadsRelayListFile) {
  std::string path = testing::TempDir() + "swarm_relay_list.txt";
  {
    std::ofstream out(path);
    out << "# local\nws://127.0.0.1:8000/\n";
  }
  SwarmOptions opts;
  opts.relay_list_path = path;
  SwarmResolveOptions(&opts);
  ASSERT_EQ(opts.relay_urls.size(), 1u);
  EXPECT_EQ(opts.relay_urls[0], "ws://127.0.0.1:8000/");
  std::remove(path.c_str());
}

TEST(SwarmOptions, Validate) {
  SwarmOptions opts;
  SwarmResolveOptions(&opts);
  std::string error;
  EXPECT_TRUE(ValidateSwarmOptions(opts, &error));

  SwarmOptions bad = opts;
  bad.backoff_multiplier = 0.5;
  EXPECT_FALSE(ValidateSwarmOptions(bad, &error));
  EXPECT_NE(error.find("backoff"), std::string::npos);

  bad = opts;
  bad.max_announce_interval_ms = bad.announce_interval_ms - 1;
  EXPECT_FALSE(ValidateSwarmOptions(bad, &error));

  bad = opts;
  bad.max_outstanding_offers = 0;
  EXPECT_FALSE(ValidateSwarmOptions(bad, &error));

  bad = opts;
  bad.relay_urls = {"https://not-a-relay.example/"};
  EXPECT_FALSE(ValidateSwarmOptions(bad, &error));
}

TEST(SwarmOptions, UsageListsRelays) {
  SwarmOptions opts;
  opts.relay_urls = {"wss://r.example/"};
  std::string usage = getUsage(opts);
  EXPECT_NE(usage.find("wss://r.example/"), std::string::npos);
  EXPECT_NE(usage.find("swarm-lobby"), std::string::npos);
}
