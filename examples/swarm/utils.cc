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

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "rtc_base/crypto_random.h"
#include "rtc_base/logging.h"
#include "rtc_base/string_encode.h"

namespace {

const char kBase36Table[] = "0123456789abcdefghijklmnopqrstuvwxyz";

std::string trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string SwarmCreateOfferId() {
  std::string bytes;
  if (!rtc::CreateRandomData(kSwarmOfferIdBytes, &bytes)) {
    RTC_LOG(LS_ERROR) << "Failed to draw random bytes for offer id";
    return "";
  }
  return rtc::hex_encode(bytes);
}

std::string SwarmCreatePeerId() {
  std::string suffix;
  if (!rtc::CreateRandomString(9, kBase36Table, &suffix)) {
    RTC_LOG(LS_ERROR) << "Failed to draw random peer id";
    return "";
  }
  return "peer_" + suffix;
}

std::string SwarmInfoHashFromTopic(const std::string& topic) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(topic.data(), topic.size(), digest, &digest_len, EVP_sha1(),
                 nullptr) != 1) {
    RTC_LOG(LS_ERROR) << "SHA-1 digest of topic failed";
    return "";
  }
  return rtc::hex_encode(
      std::string(reinterpret_cast<const char*>(digest), digest_len));
}

bool ParseRelayUrl(const std::string& url, RelayUrl* out) {
  RelayUrl parsed;
  std::string rest;
  if (url.rfind("wss://", 0) == 0) {
    parsed.secure = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    parsed.secure = false;
    rest = url.substr(5);
  } else {
    RTC_LOG(LS_WARNING) << "Relay url is not ws:// or wss://: " << url;
    return false;
  }

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    parsed.path = rest.substr(slash);
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    parsed.host = authority.substr(0, colon);
    std::string port_str = authority.substr(colon + 1);

    const char* start_ptr = port_str.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long port_val = strtol(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0' ||
        port_val <= 0 || port_val > 65535) {
      RTC_LOG(LS_WARNING) << "Invalid port in relay url: " << url;
      return false;
    }
    parsed.port = port_str;
  } else {
    parsed.host = authority;
    parsed.port = parsed.secure ? "443" : "80";
  }

  if (parsed.host.empty()) {
    RTC_LOG(LS_WARNING) << "Relay url has no host: " << url;
    return false;
  }

  if (out) {
    *out = parsed;
  }
  return true;
}

std::vector<std::string> ParseRelayList(const std::string& text) {
  std::vector<std::string> urls;
  std::unordered_set<std::string> seen;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line.rfind("ws://", 0) != 0 && line.rfind("wss://", 0) != 0) {
      RTC_LOG(LS_VERBOSE) << "Skipping non-websocket relay: " << line;
      continue;
    }
    if (seen.insert(line).second) {
      urls.push_back(line);
    }
  }
  return urls;
}

bool SwarmLoadRelayList(const std::string& path, std::vector<std::string>* urls) {
  std::ifstream file(path);
  if (!file.is_open()) {
    RTC_LOG(LS_ERROR) << "Failed to open relay list: " << path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  *urls = ParseRelayList(oss.str());
  RTC_LOG(LS_INFO) << "Loaded " << urls->size() << " relays from " << path;
  return true;
}

std::vector<std::string> SwarmDefaultRelayUrls() {
  return {
      "wss://tracker.openwebtorrent.com/",
      "wss://tracker.btorrent.xyz/",
      "wss://tracker.fastcast.nz/",
      "wss://tracker.files.fm:7073/announce",
      "wss://tracker.sloppyta.co/",
      "wss://tracker.webtorrent.dev/",
      "wss://tracker.novage.com.ua/",
      "wss://tracker.magnetoo.io/",
      "wss://tracker.ghostchu-services.top:443/announce",
  };
}

double SwarmNextAnnounceIntervalMs(double current_ms, double multiplier, double max_ms) {
  return std::min(current_ms * multiplier, max_ms);
}

std::vector<std::string> stringSplit(std::string input, std::string delimiter) {
  std::vector<std::string> tokens;
  size_t pos = 0;
  while ((pos = input.find(delimiter)) != std::string::npos) {
    tokens.push_back(input.substr(0, pos));
    input.erase(0, pos + delimiter.size());
  }
  tokens.push_back(input);
  return tokens;
}
