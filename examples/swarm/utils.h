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

#ifndef EXAMPLES_SWARM_UTILS_H_
#define EXAMPLES_SWARM_UTILS_H_

#include <string>
#include <vector>

#include "swarm.h"

// Length in bytes of an offer id before hex encoding (160 bits).
inline constexpr size_t kSwarmOfferIdBytes = 20;

// 40 lowercase hex characters drawn from the crypto RNG.
SWARM_API std::string SwarmCreateOfferId();

// "peer_" followed by 9 random base-36 characters.
SWARM_API std::string SwarmCreatePeerId();

// Lowercase hex SHA-1 of the topic, used as the tracker info_hash.
SWARM_API std::string SwarmInfoHashFromTopic(const std::string& topic);

struct RelayUrl {
  bool secure = false;
  std::string host;
  std::string port;
  std::string path = "/";
};

// Accepts ws://host[:port][/path] and wss://host[:port][/path].
SWARM_API bool ParseRelayUrl(const std::string& url, RelayUrl* out);

// One URL per line. Blank lines, '#' comments, non-WebSocket schemes and
// duplicates are dropped; order of first appearance is kept.
SWARM_API std::vector<std::string> ParseRelayList(const std::string& text);

// Reads a relay list file. Returns false if the file cannot be read.
SWARM_API bool SwarmLoadRelayList(const std::string& path,
                                  std::vector<std::string>* urls);

// Public WebTorrent trackers used when nothing else is configured.
SWARM_API std::vector<std::string> SwarmDefaultRelayUrls();

// min(current * multiplier, max).
SWARM_API double SwarmNextAnnounceIntervalMs(double current_ms,
                                             double multiplier,
                                             double max_ms);

std::vector<std::string> stringSplit(std::string input, std::string delimiter);

#endif  // EXAMPLES_SWARM_UTILS_H_
