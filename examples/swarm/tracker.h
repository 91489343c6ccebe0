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

#ifndef EXAMPLES_SWARM_TRACKER_H_
#define EXAMPLES_SWARM_TRACKER_H_

#include <json/json.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <api/task_queue/task_queue_base.h>
#include <api/units/time_delta.h>
#include <rtc_base/task_utils/repeating_task.h>

#include "relay_channel.h"
#include "swarm.h"

// What an incoming relay frame means, in the order it is checked.
enum class RelayMessageKind {
  kOffer,    // offer + peer_id
  kAnswer,   // answer + peer_id
  kFailure,  // "failure reason"
  kStats,    // action "announce"
  kScrape,   // action "scrape"
  kUnknown,
};

SWARM_API const char* RelayMessageKindToString(RelayMessageKind kind);
SWARM_API RelayMessageKind ClassifyRelayMessage(const Json::Value& message);

struct OfferEntry {
  std::string offer_id;
  std::string sdp;
};

SWARM_API Json::Value BuildAnnounce(const std::string& info_hash,
                                    const std::string& peer_id,
                                    int numwant,
                                    const std::vector<OfferEntry>& offers);

SWARM_API Json::Value BuildAnswer(const std::string& info_hash,
                                  const std::string& peer_id,
                                  const std::string& to_peer_id,
                                  const std::string& offer_id,
                                  const std::string& sdp);

// {type, sdp} or {type:"candidate", candidate:{candidate, sdpMid, sdpMLineIndex}}
SWARM_API Json::Value SignalMessageToJson(const SignalMessage& message);
SWARM_API bool SignalMessageFromJson(const Json::Value& value, SignalMessage* out);

// False, with a reason, for anything that is not a JSON object.
SWARM_API bool ParseRelayMessage(const std::string& text,
                                 Json::Value* out,
                                 std::string* error);
// Compact single-line JSON.
SWARM_API std::string WriteRelayMessage(const Json::Value& message);

// One connected relay plus its announce schedule. The interval starts at
// initial_interval_ms and is multiplied by backoff_multiplier after every
// scheduled announce, up to max_interval_ms.
class SWARM_API TrackerConnection {
 public:
  using AnnounceCallback = std::function<void(TrackerConnection* tracker)>;

  TrackerConnection(std::unique_ptr<RelayChannel> channel,
                    double initial_interval_ms,
                    double max_interval_ms,
                    double backoff_multiplier);
  ~TrackerConnection();

  TrackerConnection(const TrackerConnection&) = delete;
  TrackerConnection& operator=(const TrackerConnection&) = delete;

  const std::string& url() const { return channel_->url(); }
  RelayChannel* channel() const { return channel_.get(); }

  bool Send(const Json::Value& message);

  // First callback after one current interval. The callback must not
  // destroy this object.
  void StartAnnouncing(webrtc::TaskQueueBase* queue, AnnounceCallback on_announce);
  void StopAnnouncing();
  bool announcing() const { return announce_task_.Running(); }

  double current_interval_ms() const { return current_interval_ms_; }
  int announce_count() const { return announce_count_; }

  // Counts one scheduled announce, grows the interval and returns the delay
  // until the next one.
  webrtc::TimeDelta RecordScheduledAnnounce();

 private:
  std::unique_ptr<RelayChannel> channel_;
  const double max_interval_ms_;
  const double backoff_multiplier_;
  double current_interval_ms_;
  int announce_count_ = 0;
  webrtc::RepeatingTaskHandle announce_task_;
};

#endif  // EXAMPLES_SWARM_TRACKER_H_
