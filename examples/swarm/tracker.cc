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

#include <cmath>
#include <utility>

#include "status.h"
#include "utils.h"

namespace {

bool hasString(const Json::Value& message, const char* key) {
  return message.isMember(key) && message[key].isString();
}

}  // namespace

const char* RelayMessageKindToString(RelayMessageKind kind) {
  switch (kind) {
    case RelayMessageKind::kOffer:
      return "offer";
    case RelayMessageKind::kAnswer:
      return "answer";
    case RelayMessageKind::kFailure:
      return "failure";
    case RelayMessageKind::kStats:
      return "stats";
    case RelayMessageKind::kScrape:
      return "scrape";
    case RelayMessageKind::kUnknown:
      return "unknown";
  }
  return "unknown";
}

RelayMessageKind ClassifyRelayMessage(const Json::Value& message) {
  if (!message.isObject()) {
    return RelayMessageKind::kUnknown;
  }
  const bool has_peer = hasString(message, Tracker::kPeerId);
  if (message.isMember(Tracker::kOffer) && has_peer) {
    return RelayMessageKind::kOffer;
  }
  if (message.isMember(Tracker::kAnswer) && has_peer) {
    return RelayMessageKind::kAnswer;
  }
  if (message.isMember(Tracker::kFailureReason)) {
    return RelayMessageKind::kFailure;
  }
  if (hasString(message, Tracker::kAction)) {
    const std::string action = message[Tracker::kAction].asString();
    if (action == Tracker::kAnnounce) {
      return RelayMessageKind::kStats;
    }
    if (action == Tracker::kScrape) {
      return RelayMessageKind::kScrape;
    }
  }
  return RelayMessageKind::kUnknown;
}

Json::Value BuildAnnounce(const std::string& info_hash,
                          const std::string& peer_id,
                          int numwant,
                          const std::vector<OfferEntry>& offers) {
  Json::Value message(Json::objectValue);
  message[Tracker::kAction] = Tracker::kAnnounce;
  message[Tracker::kInfoHash] = info_hash;
  message[Tracker::kPeerId] = peer_id;
  message[Tracker::kNumWant] = numwant;
  if (!offers.empty()) {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : offers) {
      Json::Value item(Json::objectValue);
      item[Tracker::kOfferId] = entry.offer_id;
      item[Tracker::kOffer] = SignalMessageToJson(SignalMessage::Offer(entry.sdp));
      list.append(item);
    }
    message[Tracker::kOffers] = list;
  }
  return message;
}

Json::Value BuildAnswer(const std::string& info_hash,
                        const std::string& peer_id,
                        const std::string& to_peer_id,
                        const std::string& offer_id,
                        const std::string& sdp) {
  Json::Value message(Json::objectValue);
  message[Tracker::kAction] = Tracker::kAnnounce;
  message[Tracker::kInfoHash] = info_hash;
  message[Tracker::kPeerId] = peer_id;
  message[Tracker::kToPeerId] = to_peer_id;
  message[Tracker::kOfferId] = offer_id;
  message[Tracker::kAnswer] = SignalMessageToJson(SignalMessage::Answer(sdp));
  return message;
}

Json::Value SignalMessageToJson(const SignalMessage& message) {
  Json::Value value(Json::objectValue);
  switch (message.type) {
    case SignalMessage::Type::kOffer:
      value[Signal::kType] = Signal::kTypeOffer;
      value[Signal::kSdp] = message.sdp;
      break;
    case SignalMessage::Type::kAnswer:
      value[Signal::kType] = Signal::kTypeAnswer;
      value[Signal::kSdp] = message.sdp;
      break;
    case SignalMessage::Type::kCandidate: {
      Json::Value candidate(Json::objectValue);
      candidate[Signal::kCandidate] = message.candidate.candidate;
      candidate[Signal::kSdpMid] = message.candidate.sdp_mid;
      candidate[Signal::kSdpMLineIndex] = message.candidate.sdp_mline_index;
      value[Signal::kType] = Signal::kTypeCandidate;
      value[Signal::kCandidate] = candidate;
      break;
    }
  }
  return value;
}

bool SignalMessageFromJson(const Json::Value& value, SignalMessage* out) {
  if (!value.isObject() || !hasString(value, Signal::kType)) {
    return false;
  }
  const std::string type = value[Signal::kType].asString();
  if (type == Signal::kTypeOffer || type == Signal::kTypeAnswer) {
    if (!hasString(value, Signal::kSdp)) {
      return false;
    }
    const std::string sdp = value[Signal::kSdp].asString();
    *out = type == Signal::kTypeOffer ? SignalMessage::Offer(sdp)
                                      : SignalMessage::Answer(sdp);
    return true;
  }
  if (type == Signal::kTypeCandidate) {
    const Json::Value& candidate = value[Signal::kCandidate];
    if (!candidate.isObject() || !hasString(candidate, Signal::kCandidate)) {
      return false;
    }
    IceCandidate parsed;
    parsed.candidate = candidate[Signal::kCandidate].asString();
    if (hasString(candidate, Signal::kSdpMid)) {
      parsed.sdp_mid = candidate[Signal::kSdpMid].asString();
    }
    if (candidate[Signal::kSdpMLineIndex].isInt()) {
      parsed.sdp_mline_index = candidate[Signal::kSdpMLineIndex].asInt();
    }
    *out = SignalMessage::Candidate(parsed);
    return true;
  }
  return false;
}

bool ParseRelayMessage(const std::string& text,
                       Json::Value* out,
                       std::string* error) {
  Json::CharReaderBuilder reader_builder;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  std::string errors;
  Json::Value value;
  if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
    if (error) {
      *error = "not JSON: " + errors;
    }
    return false;
  }
  if (!value.isObject()) {
    if (error) {
      *error = "not a JSON object";
    }
    return false;
  }
  *out = std::move(value);
  return true;
}

std::string WriteRelayMessage(const Json::Value& message) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, message);
}

TrackerConnection::TrackerConnection(std::unique_ptr<RelayChannel> channel,
                                     double initial_interval_ms,
                                     double max_interval_ms,
                                     double backoff_multiplier)
    : channel_(std::move(channel)),
      max_interval_ms_(max_interval_ms),
      backoff_multiplier_(backoff_multiplier),
      current_interval_ms_(initial_interval_ms) {}

TrackerConnection::~TrackerConnection() {
  StopAnnouncing();
  channel_->Close();
}

bool TrackerConnection::Send(const Json::Value& message) {
  if (!channel_->IsOpen()) {
    RTC_LOG(LS_WARNING) << "Relay " << url() << " is not open";
    return false;
  }
  return channel_->Send(WriteRelayMessage(message));
}

void TrackerConnection::StartAnnouncing(webrtc::TaskQueueBase* queue,
                                        AnnounceCallback on_announce) {
  if (announce_task_.Running()) {
    return;
  }
  announce_task_ = webrtc::RepeatingTaskHandle::DelayedStart(
      queue,
      webrtc::TimeDelta::Millis(std::llround(current_interval_ms_)),
      [this, on_announce = std::move(on_announce)]() {
        on_announce(this);
        return RecordScheduledAnnounce();
      });
}

void TrackerConnection::StopAnnouncing() {
  announce_task_.Stop();
}

webrtc::TimeDelta TrackerConnection::RecordScheduledAnnounce() {
  ++announce_count_;
  current_interval_ms_ = SwarmNextAnnounceIntervalMs(
      current_interval_ms_, backoff_multiplier_, max_interval_ms_);
  RTC_LOG(LS_VERBOSE) << "Relay " << url() << " announce #" << announce_count_
                      << ", next in " << current_interval_ms_ << " ms";
  return webrtc::TimeDelta::Millis(std::llround(current_interval_ms_));
}
