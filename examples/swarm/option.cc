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

#include <cerrno>      // For errno used with strtol
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <json/json.h>
#include <memory>
#include <sstream>
#include <unordered_set>

#include "rtc_base/logging.h"

#include "option.h"
#include "utils.h"

namespace {

// Utility to remove surrounding single or double quotes from a string.
std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool parseInt(const std::string& name, const std::string& value, int& out) {
    const char* start_ptr = value.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long parsed = strtol(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0' ||
        parsed < INT32_MIN || parsed > INT32_MAX) {
        RTC_LOG(LS_WARNING) << "Invalid integer for " << name << ": " << value;
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool parseDouble(const std::string& name, const std::string& value, double& out) {
    const char* start_ptr = value.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    double parsed = strtod(start_ptr, &end_ptr);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        RTC_LOG(LS_WARNING) << "Invalid number for " << name << ": " << value;
        return false;
    }
    out = parsed;
    return true;
}

// "--name=value" -> value, if arg carries that prefix.
bool valueOf(const std::string& arg, const char* name, std::string& value) {
    std::string prefix = std::string(name) + "=";
    if (arg.rfind(prefix, 0) != 0) {
        return false;
    }
    value = stripQuotes(arg.substr(prefix.size()));
    return true;
}

void appendList(const std::string& value, std::vector<std::string>& list) {
    for (const auto& item : stringSplit(value, ",")) {
        if (!item.empty()) {
            list.push_back(item);
        }
    }
}

void readStringArray(const Json::Value& config, const char* key,
                     std::vector<std::string>& out) {
    if (!config.isMember(key)) {
        return;
    }
    const Json::Value& array = config[key];
    if (!array.isArray()) {
        RTC_LOG(LS_WARNING) << "`" << key << "` is not an array, ignored";
        return;
    }
    std::vector<std::string> values;
    for (Json::ArrayIndex i = 0; i < array.size(); ++i) {
        if (!array[i].isString()) {
            RTC_LOG(LS_WARNING) << key << " element " << i << " is not string, skipping";
            continue;
        }
        values.push_back(array[i].asString());
    }
    out = values;
}

void readString(const Json::Value& config, const char* key, std::string& out) {
    if (config.isMember(key) && config[key].isString()) {
        out = config[key].asString();
        RTC_LOG(LS_INFO) << "Config " << key << ": " << out;
    }
}

void readInt(const Json::Value& config, const char* key, int& out) {
    if (!config.isMember(key)) {
        return;
    }
    if (config[key].isInt()) {
        out = config[key].asInt();
        RTC_LOG(LS_INFO) << "Config " << key << ": " << out;
    } else {
        RTC_LOG(LS_WARNING) << "`" << key << "` is not an integer, ignored";
    }
}

void readBool(const Json::Value& config, const char* key, bool& out) {
    if (config.isMember(key) && config[key].isBool()) {
        out = config[key].asBool();
        RTC_LOG(LS_INFO) << "Config " << key << ": " << out;
    }
}

}  // namespace

void applyConfigJson(const std::string& contents, SwarmOptions& opts) {
    Json::Value config_json;
    Json::CharReaderBuilder reader_builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    bool parsingSuccessful = reader->parse(
        contents.data(), contents.data() + contents.size(), &config_json, &errs);

    if (!parsingSuccessful || !config_json.isObject()) {
        RTC_LOG(LS_ERROR) << "Failed to parse config: " << errs;
        return;
    }

    readStringArray(config_json, "relay_urls", opts.relay_urls);
    readString(config_json, "relay_list", opts.relay_list_path);
    readString(config_json, "topic", opts.topic);
    readString(config_json, "info_hash", opts.info_hash);
    readString(config_json, "peer_id", opts.peer_id);
    readString(config_json, "greeting", opts.greeting);

    readInt(config_json, "numwant", opts.numwant);
    readInt(config_json, "announce_interval_ms", opts.announce_interval_ms);
    readInt(config_json, "max_announce_interval_ms", opts.max_announce_interval_ms);
    readInt(config_json, "offer_timeout_ms", opts.offer_timeout_ms);
    readInt(config_json, "max_outstanding_offers", opts.max_outstanding_offers);
    readInt(config_json, "negotiation_timeout_ms", opts.negotiation_timeout_ms);
    readInt(config_json, "ice_gathering_timeout_ms", opts.ice_gathering_timeout_ms);
    readInt(config_json, "startup_timeout_ms", opts.startup_timeout_ms);
    readInt(config_json, "relay_connect_timeout_ms", opts.relay_connect_timeout_ms);
    readInt(config_json, "max_pending_candidates", opts.max_pending_candidates);

    if (config_json.isMember("backoff_multiplier")) {
        if (config_json["backoff_multiplier"].isNumeric()) {
            opts.backoff_multiplier = config_json["backoff_multiplier"].asDouble();
        } else {
            RTC_LOG(LS_WARNING) << "`backoff_multiplier` is not a number, ignored";
        }
    }

    readStringArray(config_json, "ice_servers", opts.ice_servers);

    readBool(config_json, "log_json", opts.log_json);
    readBool(config_json, "verbose", opts.verbose);
}

SwarmOptions parseOptions(const char* argString) {
    std::vector<std::string> args;
    for (const auto& piece : stringSplit(argString ? argString : "", " ")) {
        if (!piece.empty()) {
            args.push_back(piece);
        }
    }
    return parseOptions(args);
}

SwarmOptions parseOptions(const std::vector<std::string>& args) {
  SwarmOptions opts;
  opts.help_string =
      "Usage:\n"
      "swarm [options]\n\n"
      "Options:\n"
      "  --config=<path>                    Load options from JSON config file.\n"
      "                                     Command-line options override config file.\n"
      "  --topic=<name>                     Pool to join (default: swarm-lobby)\n"
      "  --info_hash=<hex>                  Tracker info_hash (default: sha1(topic))\n"
      "  --peer_id=<id>                     Local peer id (default: random peer_xxxxxxxxx)\n"
      "  --relay=<url>[,<url>...]           Tracker url, ws:// or wss://, repeatable\n"
      "  --relay_list=<path>                File with one tracker url per line\n"
      "  --numwant=<n>                      Peers wanted per announce (default: 50)\n"
      "  --announce_interval_ms=<ms>        Initial announce interval (default: 5000)\n"
      "  --max_announce_interval_ms=<ms>    Announce interval cap (default: 120000)\n"
      "  --backoff=<factor>                 Announce interval multiplier (default: 1.1)\n"
      "  --offer_timeout_ms=<ms>            Unanswered offer lifetime (default: 2 intervals)\n"
      "  --max_outstanding_offers=<n>       Unanswered offers allowed at once (default: 1)\n"
      "  --negotiation_timeout_ms=<ms>      Handshake deadline per session (default: 30000)\n"
      "  --ice_gathering_timeout_ms=<ms>    Candidate gathering bound (default: 3000)\n"
      "  --startup_timeout_ms=<ms>          First offer preparation bound (default: 10000)\n"
      "  --relay_connect_timeout_ms=<ms>    Per-relay connect bound (default: 5000)\n"
      "  --ice_server=<uri>[,<uri>...]      STUN/TURN uri, repeatable\n"
      "  --greeting=<text>                  Text sent to every connected peer\n"
      "  --log_json                         Print log lines as JSON\n"
      "  --verbose                          Verbose logging\n"
      "  --help                             Show this help message\n\n"
      "Examples:\n"
      "  swarm --topic=my-game\n"
      "  swarm --config settings.json --relay=wss://tracker.openwebtorrent.com/\n";

  const std::unordered_set<std::string> known_options = {
    "--config", "--topic", "--info_hash", "--peer_id", "--relay", "--relay_list",
    "--numwant", "--announce_interval_ms", "--max_announce_interval_ms", "--backoff",
    "--offer_timeout_ms", "--max_outstanding_offers", "--negotiation_timeout_ms",
    "--ice_gathering_timeout_ms", "--startup_timeout_ms", "--relay_connect_timeout_ms",
    "--max_pending_candidates", "--ice_server", "--greeting", "--log_json", "--verbose",
    "--help"
  };

  // --- First pass: check for --config ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config" && i + 1 < args.size()) {
      opts.config_path = args[i + 1];
      break;
    } else if (arg.find("--config=") == 0) {
      opts.config_path = arg.substr(9);
      break;
    } else if (arg == "--help") {
      opts.help = true;
      return opts;
    }
  }

  // --- Load from config file if specified ---
  if (!opts.config_path.empty()) {
    FILE* fp = fopen(opts.config_path.c_str(), "rb");
    if (fp) {
      std::string contents;
      fseek(fp, 0, SEEK_END);
      long size = ftell(fp);
      rewind(fp);
      if (size > 0) {
        contents.resize(static_cast<size_t>(size));
        size_t bytes_read = fread(&contents[0], 1, contents.size(), fp);
        contents.resize(bytes_read);
      }
      fclose(fp);
      RTC_LOG(LS_VERBOSE) << "Read " << contents.size() << " bytes of config";
      applyConfigJson(contents, opts);
      RTC_LOG(LS_INFO) << "Loaded options from config file: " << opts.config_path;
    } else {
      RTC_LOG(LS_WARNING) << "Could not open config file: " << opts.config_path;
    }
  }

  // --- Second pass: parse command-line arguments (overriding config) ---
  std::vector<std::string> cli_relays;
  std::vector<std::string> cli_ice_servers;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    std::string value;

    if (arg == "--config" && i + 1 < args.size()) {
      i++;
      continue;
    } else if (arg.find("--config=") == 0) {
      continue;
    }

    if (valueOf(arg, "--topic", value)) {
      opts.topic = value;
    } else if (valueOf(arg, "--info_hash", value)) {
      opts.info_hash = value;
    } else if (valueOf(arg, "--peer_id", value)) {
      opts.peer_id = value;
    } else if (valueOf(arg, "--relay", value)) {
      appendList(value, cli_relays);
    } else if (valueOf(arg, "--relay_list", value)) {
      opts.relay_list_path = value;
    } else if (valueOf(arg, "--numwant", value)) {
      parseInt("numwant", value, opts.numwant);
    } else if (valueOf(arg, "--announce_interval_ms", value)) {
      parseInt("announce_interval_ms", value, opts.announce_interval_ms);
    } else if (valueOf(arg, "--max_announce_interval_ms", value)) {
      parseInt("max_announce_interval_ms", value, opts.max_announce_interval_ms);
    } else if (valueOf(arg, "--backoff", value)) {
      parseDouble("backoff", value, opts.backoff_multiplier);
    } else if (valueOf(arg, "--offer_timeout_ms", value)) {
      parseInt("offer_timeout_ms", value, opts.offer_timeout_ms);
    } else if (valueOf(arg, "--max_outstanding_offers", value)) {
      parseInt("max_outstanding_offers", value, opts.max_outstanding_offers);
    } else if (valueOf(arg, "--negotiation_timeout_ms", value)) {
      parseInt("negotiation_timeout_ms", value, opts.negotiation_timeout_ms);
    } else if (valueOf(arg, "--ice_gathering_timeout_ms", value)) {
      parseInt("ice_gathering_timeout_ms", value, opts.ice_gathering_timeout_ms);
    } else if (valueOf(arg, "--startup_timeout_ms", value)) {
      parseInt("startup_timeout_ms", value, opts.startup_timeout_ms);
    } else if (valueOf(arg, "--relay_connect_timeout_ms", value)) {
      parseInt("relay_connect_timeout_ms", value, opts.relay_connect_timeout_ms);
    } else if (valueOf(arg, "--max_pending_candidates", value)) {
      parseInt("max_pending_candidates", value, opts.max_pending_candidates);
    } else if (valueOf(arg, "--ice_server", value)) {
      appendList(value, cli_ice_servers);
    } else if (valueOf(arg, "--greeting", value)) {
      opts.greeting = value;
    } else if (arg == "--log_json") {
      opts.log_json = true;
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--help") {
      opts.help = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::string opt_name = arg.substr(0, arg.find('=') != std::string::npos ? arg.find('=') : arg.length());
      if (known_options.find(opt_name) == known_options.end()) {
        RTC_LOG(LS_WARNING) << "Unknown option: " << arg;
      } else {
        RTC_LOG(LS_WARNING) << "Option needs a value: " << arg;
      }
    } else {
      RTC_LOG(LS_WARNING) << "Ignoring positional argument: " << arg;
    }
  }

  if (!cli_relays.empty()) {
    opts.relay_urls = cli_relays;
  }
  if (!cli_ice_servers.empty()) {
    opts.ice_servers = cli_ice_servers;
  }

  return opts;
}

void SwarmResolveOptions(SwarmOptions* opts) {
  if (opts->relay_urls.empty() && !opts->relay_list_path.empty()) {
    std::vector<std::string> urls;
    if (SwarmLoadRelayList(opts->relay_list_path, &urls)) {
      opts->relay_urls = urls;
    }
  }
  if (opts->relay_urls.empty()) {
    RTC_LOG(LS_INFO) << "No relays configured, using built-in tracker list";
    opts->relay_urls = SwarmDefaultRelayUrls();
  }
  if (opts->info_hash.empty()) {
    opts->info_hash = SwarmInfoHashFromTopic(opts->topic);
    RTC_LOG(LS_INFO) << "info_hash for topic '" << opts->topic << "': " << opts->info_hash;
  }
  if (opts->peer_id.empty()) {
    opts->peer_id = SwarmCreatePeerId();
    RTC_LOG(LS_INFO) << "Auto-generated peer_id: " << opts->peer_id;
  }
}

bool ValidateSwarmOptions(const SwarmOptions& opts, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = message;
    }
    RTC_LOG(LS_ERROR) << "Invalid options: " << message;
    return false;
  };

  if (opts.numwant < 1) {
    return fail("numwant must be at least 1");
  }
  if (opts.announce_interval_ms <= 0) {
    return fail("announce_interval_ms must be positive");
  }
  if (opts.max_announce_interval_ms < opts.announce_interval_ms) {
    return fail("max_announce_interval_ms must not be below announce_interval_ms");
  }
  if (opts.backoff_multiplier < 1.0) {
    return fail("backoff multiplier must be at least 1.0");
  }
  if (opts.offer_timeout_ms < 0) {
    return fail("offer_timeout_ms must not be negative");
  }
  if (opts.max_outstanding_offers < 1) {
    return fail("max_outstanding_offers must be at least 1");
  }
  if (opts.negotiation_timeout_ms <= 0 || opts.ice_gathering_timeout_ms <= 0 ||
      opts.startup_timeout_ms <= 0 || opts.relay_connect_timeout_ms <= 0) {
    return fail("timeouts must be positive");
  }
  if (opts.max_pending_candidates < 0) {
    return fail("max_pending_candidates must not be negative");
  }
  for (const auto& url : opts.relay_urls) {
    if (!ParseRelayUrl(url, nullptr)) {
      return fail("bad relay url: " + url);
    }
  }
  return true;
}

std::string getUsage(const SwarmOptions& opts) {
  std::stringstream usage;

  usage << "\n--- Current Settings ---\n";
  usage << "Topic: " << opts.topic << "\n";
  usage << "Info hash: " << (!opts.info_hash.empty() ? opts.info_hash : "(from topic)") << "\n";
  usage << "Peer id: " << (!opts.peer_id.empty() ? opts.peer_id : "(random)") << "\n";
  usage << "Relays: " << opts.relay_urls.size() << "\n";
  for (const auto& url : opts.relay_urls) {
    usage << "  " << url << "\n";
  }
  usage << "Numwant: " << opts.numwant << "\n";
  usage << "Announce interval: " << opts.announce_interval_ms << "ms, x"
        << opts.backoff_multiplier << " up to " << opts.max_announce_interval_ms << "ms\n";
  usage << "Max outstanding offers: " << opts.max_outstanding_offers << "\n";
  usage << "Negotiation timeout: " << opts.negotiation_timeout_ms << "ms\n";
  usage << "ICE servers: " << opts.ice_servers.size() << "\n";
  if (!opts.config_path.empty()) {
    usage << "Config File Used: " << opts.config_path << "\n";
  }
  usage << "------------------------\n";

  return usage.str();
}
