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

#ifndef EXAMPLES_SWARM_PEER_SESSION_H_
#define EXAMPLES_SWARM_PEER_SESSION_H_

#include <memory>
#include <string>
#include <vector>

#include <api/sequence_checker.h>
#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>
#include <api/units/time_delta.h>

#include "events.h"
#include "peer_transport.h"
#include "swarm.h"

enum class SessionEventType { kSignal, kConnect, kData, kError, kClose };

struct SessionEvent {
  SignalMessage signal;  // kSignal
  std::string data;      // kData
  SwarmError error;      // kError
};

// Drives one transport through the offer/answer/candidate handshake, in
// either role, and reports the result as events:
//   kSignal  - payload to hand to the remote side
//   kConnect - data channel is open (at most once)
//   kData    - message from the remote side
//   kError   - handshake or transport failure, session is FAILED
//   kClose   - session closed, locally or by the remote side
//
// Sessions are shared-owned; every method must be called on the thread the
// session was created on.
class SWARM_API PeerSession : public PeerTransportObserver,
                              public std::enable_shared_from_this<PeerSession> {
 public:
  enum class State {
    kNew,
    kLocalOfferSent,
    kRemoteOfferReceived,
    kLocalAnswerSent,
    kConnected,
    kClosed,
    kFailed,
  };

  struct Config {
    bool initiator = false;
    // Emit candidates one by one instead of waiting for gathering to finish.
    bool trickle = false;
    webrtc::TimeDelta ice_gathering_timeout = webrtc::TimeDelta::Seconds(3);
    webrtc::TimeDelta negotiation_timeout = webrtc::TimeDelta::Seconds(30);
    // Remote candidates held until a remote description exists.
    size_t max_pending_candidates = 32;
    std::string local_peer_id;
  };

  using Handler = EventDispatcher<SessionEventType, SessionEvent>::Handler;

  static std::shared_ptr<PeerSession> Create(
      std::unique_ptr<PeerTransport> transport, const Config& config);
  ~PeerSession() override;

  // Initiator only: generate the local offer. It is emitted as kSignal once
  // gathering completes or ice_gathering_timeout elapses.
  void Start();

  // Accepts a remote offer (responder), answer (initiator) or candidate.
  void Signal(const SignalMessage& message);

  // False unless the session is CONNECTED and the channel accepted the data.
  bool Send(const std::string& data);

  // Safe from any state; only the first call emits kClose.
  void Close();

  int AddHandler(SessionEventType type, Handler handler);
  void RemoveHandler(int id);

  State state() const;
  bool initiator() const { return config_.initiator; }
  bool IsTerminal() const;

  const std::string& local_peer_id() const { return config_.local_peer_id; }
  const std::string& remote_peer_id() const { return remote_peer_id_; }
  void set_remote_peer_id(const std::string& id) { remote_peer_id_ = id; }

  const std::string& offer_id() const { return offer_id_; }
  void set_offer_id(const std::string& id) { offer_id_ = id; }

  size_t pending_candidate_count() const { return pending_ice_candidates_.size(); }

  static const char* StateToString(State state);

  // PeerTransportObserver
  void OnIceGatheringChange(IceGatheringState state) override;
  void OnIceCandidate(const IceCandidate& candidate) override;
  void OnChannelOpen() override;
  void OnChannelClosed() override;
  void OnChannelError(const std::string& message) override;
  void OnChannelMessage(const std::string& data) override;

 private:
  PeerSession(std::unique_ptr<PeerTransport> transport, const Config& config);

  void ApplyRemoteOffer(const std::string& sdp);
  void ApplyRemoteAnswer(const std::string& sdp);
  void AddRemoteCandidate(const IceCandidate& candidate);

  // Drain any remote candidates that were received before the remote
  // description was applied.
  void DrainPendingIceCandidates();

  void OnLocalDescriptionApplied(webrtc::SdpType type, const std::string& sdp);
  void EmitLocalDescription();
  void StartNegotiationTimer();

  void SetState(State state);
  void Fail(SwarmErrorType type, const std::string& message);
  void Emit(SessionEventType type, const SessionEvent& event);

  webrtc::SequenceChecker sequence_checker_;
  webrtc::TaskQueueBase* const task_queue_;
  const Config config_;
  std::unique_ptr<PeerTransport> transport_;

  State state_ = State::kNew;
  std::string remote_peer_id_;
  std::string offer_id_;

  bool offer_requested_ = false;
  bool remote_description_requested_ = false;
  bool negotiation_timer_armed_ = false;

  webrtc::SdpType local_type_ = webrtc::SdpType::kOffer;
  std::string local_sdp_;
  bool awaiting_gathering_ = false;
  bool description_emitted_ = false;

  std::vector<IceCandidate> pending_ice_candidates_;
  // Trickle mode: local candidates gathered before the description went out.
  std::vector<IceCandidate> pending_local_candidates_;

  EventDispatcher<SessionEventType, SessionEvent> events_;
  webrtc::ScopedTaskSafety safety_;
};

#endif  // EXAMPLES_SWARM_PEER_SESSION_H_
