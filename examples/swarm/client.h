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

#ifndef EXAMPLES_SWARM_CLIENT_H_
#define EXAMPLES_SWARM_CLIENT_H_

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <api/sequence_checker.h>
#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>

#include "events.h"
#include "option.h"
#include "peer_session.h"
#include "peer_transport.h"
#include "relay_channel.h"
#include "swarm.h"
#include "tracker.h"
#include "utils.h"

enum class DiscoveryEventType {
  kReady,             // startup finished, announcing on every open relay
  kPeerConnected,     // peer_id, session
  kPeerFailed,        // peer_id, error
  kPeerDisconnected,  // peer_id
  kStatsUpdate,       // relay_url, complete, incomplete
  kScrape,            // relay_url, scrape
  kRelayFailure,      // relay_url, reason ("failure reason" from the relay)
  kError,             // relay_url, error (relay unreachable or disconnected)
  kClosed,            // last relay gone, discovery stopped
};

SWARM_API const char* DiscoveryEventTypeToString(DiscoveryEventType type);

struct DiscoveryEvent {
  std::string peer_id;
  std::shared_ptr<PeerSession> session;
  SwarmError error;
  int complete = 0;
  int incomplete = 0;
  Json::Value scrape;
  std::string relay_url;
  std::string reason;
};

// Finds peers for one info_hash through a set of WebTorrent-style relays and
// negotiates a PeerSession with each of them.
//
// The client announces on every relay, keeps at most max_outstanding_offers
// unanswered offers, answers offers relayed from other peers and emits
// kPeerConnected once per remote peer id. The connected session then belongs
// to the caller; the client keeps only a weak reference to detect duplicates
// and to report its disconnection.
//
// Single-threaded: construct, call and destroy on one rtc::Thread. Handlers
// must not destroy the client from inside an event.
class SWARM_API PeerDiscoveryClient {
 public:
  using Handler = EventDispatcher<DiscoveryEventType, DiscoveryEvent>::Handler;
  using StartCallback = std::function<void(const SwarmError& error)>;

  // Factories must outlive the client. Empty relay_urls, info_hash and
  // peer_id in options are filled in as SwarmResolveOptions does.
  PeerDiscoveryClient(const SwarmOptions& options,
                      PeerTransportFactory* transport_factory,
                      RelayChannelFactory* relay_factory);
  ~PeerDiscoveryClient();

  PeerDiscoveryClient(const PeerDiscoveryClient&) = delete;
  PeerDiscoveryClient& operator=(const PeerDiscoveryClient&) = delete;

  // Connects to every relay. done runs once: with no error after the first
  // announce went out, or with kRelayUnreachable when every relay failed.
  // Returns false if already started or the options are invalid.
  bool Start(StartCallback done);

  // Stops announcing, closes every relay and every session that is not yet
  // connected. No further events except for the caller's connected sessions.
  void Stop();

  int AddHandler(DiscoveryEventType type, Handler handler);
  void RemoveHandler(int id);

  const SwarmOptions& options() const { return options_; }
  const std::string& peer_id() const { return options_.peer_id; }
  const std::string& info_hash() const { return options_.info_hash; }

  bool ready() const { return phase_ == Phase::kRunning; }
  // complete + incomplete from the latest relay stats.
  int discovered_peer_count() const { return discovered_count_; }
  size_t connected_peer_count() const;
  size_t outstanding_offer_count() const { return pending_offers_.size(); }
  size_t negotiating_count() const { return negotiating_.size(); }
  size_t relay_count() const { return trackers_.size(); }
  bool IsConnectedTo(const std::string& peer_id) const;
  const TrackerConnection* tracker(const std::string& url) const;

  void SetOfferIdGeneratorForTesting(std::function<std::string()> generator) {
    create_offer_id_ = std::move(generator);
  }

 private:
  enum class Phase { kIdle, kConnecting, kPreparing, kRunning, kClosed, kStopped };

  struct PendingOffer {
    std::string offer_id;
    std::shared_ptr<PeerSession> session;
    bool ready = false;
    std::string sdp;
    int64_t created_ms = 0;
    // Destroying it cancels the expiry timer.
    std::unique_ptr<webrtc::ScopedTaskSafety> expiry;
    // Gets the offer id once the sdp is ready, "" if generation failed.
    std::function<void(const std::string& offer_id)> on_ready;
  };

  struct Negotiation {
    std::shared_ptr<PeerSession> session;
    std::string relay_url;
  };

  // Relays
  void ConnectRelay(const std::string& url);
  void OnRelayConnectResult(const std::string& url, bool ok, const std::string& error);
  void OnRelayMessage(const std::string& url, const std::string& text);
  void OnRelayClosed(const std::string& url, const std::string& reason);
  void OnAllRelaysGone(const std::string& reason);
  void StartTracker(TrackerConnection* tracker);
  std::vector<std::string> TrackerUrls() const;

  // Startup
  void PrepareFirstOffer();
  void FinishStartup(const std::string& first_offer_id);
  void FailStartup(const std::string& reason);

  // Offers
  std::string GenerateOffer(std::function<void(const std::string&)> on_ready);
  void AnnounceWithOffer(const std::vector<std::string>& urls);
  void SendAnnounce(const std::vector<std::string>& urls, const std::string& offer_id);
  void ArmOfferExpiry(const std::string& offer_id, double timeout_ms);
  void DropOffer(const std::string& offer_id);
  void CloseAllPendingOffers();

  // Relayed signaling
  void OnIncomingOffer(const std::string& url, const Json::Value& message);
  void OnIncomingAnswer(const std::string& url, const Json::Value& message);

  // Sessions
  PeerSession::Config SessionConfig(bool initiator) const;
  void AttachSession(const std::shared_ptr<PeerSession>& session);
  void OnSessionSignal(PeerSession* session, const SignalMessage& signal);
  void OnSessionConnected(PeerSession* session);
  void OnSessionEnded(PeerSession* session, const SwarmError* error);
  std::shared_ptr<PeerSession> FindNegotiation(const std::string& peer_id,
                                               bool initiator) const;
  bool IsPreferredRole(bool initiator, const std::string& peer_id) const;
  void DiscardNegotiation(PeerSession* session);

  void Emit(DiscoveryEventType type, const DiscoveryEvent& event);

  webrtc::SequenceChecker sequence_checker_;
  webrtc::TaskQueueBase* const task_queue_;
  SwarmOptions options_;
  PeerTransportFactory* const transport_factory_;
  RelayChannelFactory* const relay_factory_;

  Phase phase_ = Phase::kIdle;
  StartCallback start_callback_;
  int discovered_count_ = 0;

  std::map<std::string, std::unique_ptr<RelayChannel>> connecting_;
  std::map<std::string, std::unique_ptr<TrackerConnection>> trackers_;
  std::map<std::string, PendingOffer> pending_offers_;
  std::map<PeerSession*, Negotiation> negotiating_;
  // DiscoveredPeerSet
  std::map<std::string, std::weak_ptr<PeerSession>> connected_peers_;

  std::function<std::string()> create_offer_id_ = SwarmCreateOfferId;

  EventDispatcher<DiscoveryEventType, DiscoveryEvent> events_;
  webrtc::ScopedTaskSafety safety_;
};

#endif  // EXAMPLES_SWARM_CLIENT_H_
