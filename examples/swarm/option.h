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

#pragma once

#include <string>
#include <vector>

#include "swarm.h"

// Every recognized option with its default. Millisecond fields are plain ints
// so they can be read straight from a JSON config file.
struct SwarmOptions {
    // Relays to announce on. Empty means: relay_list_path if set, else the
    // built-in public tracker list.
    std::vector<std::string> relay_urls;
    std::string relay_list_path;

    // Pool identity. info_hash defaults to SHA-1(topic).
    std::string topic = "swarm-lobby";
    std::string info_hash;
    // Local identity. Defaults to a random "peer_xxxxxxxxx".
    std::string peer_id;

    int numwant = 50;
    int announce_interval_ms = 5000;
    int max_announce_interval_ms = 120000;
    double backoff_multiplier = 1.1;
    // 0 means two of the carrying relay's current announce intervals.
    int offer_timeout_ms = 0;
    int max_outstanding_offers = 1;

    int negotiation_timeout_ms = 30000;
    int ice_gathering_timeout_ms = 3000;
    int startup_timeout_ms = 10000;
    int relay_connect_timeout_ms = 5000;
    int max_pending_candidates = 32;

    std::vector<std::string> ice_servers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun2.l.google.com:19302",
    };

    // CLI only
    std::string greeting = "hello";
    bool log_json = false;
    bool verbose = false;
    bool help = false;
    std::string help_string;
    std::string config_path;
};

// Command line > JSON config file (--config) > defaults.
SWARM_API SwarmOptions parseOptions(const std::vector<std::string>& args);
SWARM_API SwarmOptions parseOptions(const char* argString);

// Applies a parsed JSON config object onto opts. Unknown keys are ignored,
// keys with the wrong type are logged and skipped.
SWARM_API void applyConfigJson(const std::string& contents, SwarmOptions& opts);

// Fills in relay_urls, info_hash and peer_id where they were left empty.
SWARM_API void SwarmResolveOptions(SwarmOptions* opts);

SWARM_API bool ValidateSwarmOptions(const SwarmOptions& opts, std::string* error);

// Current settings, to print
SWARM_API std::string getUsage(const SwarmOptions& opts);
