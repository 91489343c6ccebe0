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

#include "peer_session.h"

#include <utility>

#include <rtc_base/checks.h>
#include <rtc_base/logging.h>

std::shared_ptr<PeerSession> PeerSession::Create(
    std::unique_ptr<PeerTransport> transport, const Config& config) {
  if (!transport) {
    RTC_LOG(LS_ERROR) << "Cannot create a session without a transport";
    return nullptr;
  }
  return std::shared_ptr<PeerSession>(
      new PeerSession(std::move(transport), config));
}

PeerSession::PeerSession(std::unique_ptr<PeerTransport> transport,
                         const Config& config)
    : task_queue_(webrtc::TaskQueueBase::Current()),
      config_(config),
      transport_(std::move(transport)) {
  RTC_DCHECK(task_queue_);
  transport_->SetObserver(this);
}

PeerSession::~PeerSession() {
  // No events from here on; the owner is already gone.
  transport_->SetObserver(nullptr);
  if (!IsTerminal()) {
    transport_->Close();
  }
}

const char* PeerSession::StateToString(State state) {
  switch (state) {
    case State::kNew:
      return "new";
    case State::kLocalOfferSent:
      return "local-offer-sent";
    case State::kRemoteOfferReceived:
      return "remote-offer-received";
    case State::kLocalAnswerSent:
      return "local-answer-sent";
    case State::kConnected:
      return "connected";
    case State::kClosed:
      return "closed";
    case State::kFailed:
      return "failed";
  }
  return "unknown";
}

PeerSession::State PeerSession::state() const {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  return state_;
}

bool PeerSession::IsTerminal() const {
  return state_ == State::kClosed || state_ == State::kFailed;
}

int PeerSession::AddHandler(SessionEventType type, Handler handler) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  return events_.AddHandler(type, std::move(handler));
}

void PeerSession::RemoveHandler(int id) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  events_.RemoveHandler(id);
}

void PeerSession::Start() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (!config_.initiator) {
    RTC_LOG(LS_WARNING) << "Start() called on a responder session, ignoring";
    return;
  }
  if (state_ != State::kNew || offer_requested_) {
    RTC_LOG(LS_VERBOSE) << "Offer already requested, state "
                        << StateToString(state_);
    return;
  }
  offer_requested_ = true;

  auto flag = safety_.flag();
  transport_->CreateOffer([this, flag](webrtc::RTCError error,
                                       const std::string& sdp) {
    if (!flag->alive() || IsTerminal()) {
      return;
    }
    if (!error.ok()) {
      Fail(SwarmErrorType::kNegotiationFailure,
           std::string("Failed to create offer: ") + error.message());
      return;
    }
    transport_->SetLocalDescription(
        webrtc::SdpType::kOffer, sdp,
        [this, flag, sdp](webrtc::RTCError error) {
          if (!flag->alive() || IsTerminal()) {
            return;
          }
          if (!error.ok()) {
            Fail(SwarmErrorType::kNegotiationFailure,
                 std::string("Failed to set local offer: ") + error.message());
            return;
          }
          OnLocalDescriptionApplied(webrtc::SdpType::kOffer, sdp);
        });
  });
}

void PeerSession::Signal(const SignalMessage& message) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (IsTerminal()) {
    RTC_LOG(LS_VERBOSE) << "Ignoring " << SignalTypeToString(message.type)
                        << " for " << StateToString(state_) << " session";
    return;
  }

  switch (message.type) {
    case SignalMessage::Type::kOffer:
      ApplyRemoteOffer(message.sdp);
      break;
    case SignalMessage::Type::kAnswer:
      ApplyRemoteAnswer(message.sdp);
      break;
    case SignalMessage::Type::kCandidate:
      AddRemoteCandidate(message.candidate);
      break;
  }
}

void PeerSession::ApplyRemoteOffer(const std::string& sdp) {
  if (config_.initiator || state_ != State::kNew ||
      remote_description_requested_) {
    RTC_LOG(LS_WARNING) << "Unexpected offer in state "
                        << StateToString(state_) << ", ignoring";
    return;
  }
  remote_description_requested_ = true;
  SetState(State::kRemoteOfferReceived);
  StartNegotiationTimer();

  auto flag = safety_.flag();
  transport_->SetRemoteDescription(
      webrtc::SdpType::kOffer, sdp, [this, flag](webrtc::RTCError error) {
        if (!flag->alive() || IsTerminal()) {
          return;
        }
        if (!error.ok()) {
          Fail(SwarmErrorType::kNegotiationFailure,
               std::string("Failed to apply remote offer: ") +
                   error.message());
          return;
        }
        RTC_LOG(LS_INFO) << "Remote offer applied";
        DrainPendingIceCandidates();

        transport_->CreateAnswer([this, flag](webrtc::RTCError error,
                                              const std::string& answer) {
          if (!flag->alive() || IsTerminal()) {
            return;
          }
          if (!error.ok()) {
            Fail(SwarmErrorType::kNegotiationFailure,
                 std::string("Failed to create answer: ") + error.message());
            return;
          }
          transport_->SetLocalDescription(
              webrtc::SdpType::kAnswer, answer,
              [this, flag, answer](webrtc::RTCError error) {
                if (!flag->alive() || IsTerminal()) {
                  return;
                }
                if (!error.ok()) {
                  Fail(SwarmErrorType::kNegotiationFailure,
                       std::string("Failed to set local answer: ") +
                           error.message());
                  return;
                }
                OnLocalDescriptionApplied(webrtc::SdpType::kAnswer, answer);
              });
        });
      });
}

void PeerSession::ApplyRemoteAnswer(const std::string& sdp) {
  if (!config_.initiator || state_ != State::kLocalOfferSent ||
      remote_description_requested_) {
    RTC_LOG(LS_WARNING) << "Unexpected answer in state "
                        << StateToString(state_) << ", ignoring";
    return;
  }
  remote_description_requested_ = true;
  StartNegotiationTimer();

  auto flag = safety_.flag();
  transport_->SetRemoteDescription(
      webrtc::SdpType::kAnswer, sdp, [this, flag](webrtc::RTCError error) {
        if (!flag->alive() || IsTerminal()) {
          return;
        }
        if (!error.ok()) {
          Fail(SwarmErrorType::kNegotiationFailure,
               std::string("Failed to apply remote answer: ") +
                   error.message());
          return;
        }
        RTC_LOG(LS_INFO) << "Remote answer applied";
        DrainPendingIceCandidates();
      });
}

void PeerSession::AddRemoteCandidate(const IceCandidate& candidate) {
  if (!transport_->HasRemoteDescription()) {
    if (pending_ice_candidates_.size() >= config_.max_pending_candidates) {
      RTC_LOG(LS_WARNING) << "Pending candidate buffer full ("
                          << pending_ice_candidates_.size()
                          << "), dropping candidate";
      return;
    }
    RTC_LOG(LS_VERBOSE) << "Queuing ICE candidate until remote description "
                           "is set";
    pending_ice_candidates_.push_back(candidate);
    return;
  }
  if (!transport_->AddIceCandidate(candidate)) {
    RTC_LOG(LS_WARNING) << "Failed to apply ICE candidate, ignoring: "
                        << candidate.candidate;
  }
}

void PeerSession::DrainPendingIceCandidates() {
  if (pending_ice_candidates_.empty()) {
    return;
  }
  RTC_LOG(LS_INFO) << "Draining " << pending_ice_candidates_.size()
                   << " pending ICE candidates";
  std::vector<IceCandidate> candidates = std::move(pending_ice_candidates_);
  pending_ice_candidates_.clear();
  for (const auto& candidate : candidates) {
    if (!transport_->AddIceCandidate(candidate)) {
      RTC_LOG(LS_WARNING) << "Failed to apply queued ICE candidate: "
                          << candidate.candidate;
    }
  }
}

void PeerSession::OnLocalDescriptionApplied(webrtc::SdpType type,
                                            const std::string& sdp) {
  local_type_ = type;
  local_sdp_ = sdp;

  if (config_.trickle ||
      transport_->ice_gathering_state() == IceGatheringState::kComplete) {
    EmitLocalDescription();
    return;
  }

  awaiting_gathering_ = true;
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(safety_.flag(),
                       [this]() {
                         if (!awaiting_gathering_ || IsTerminal()) {
                           return;
                         }
                         RTC_LOG(LS_WARNING)
                             << "ICE gathering did not finish in "
                             << config_.ice_gathering_timeout.ms()
                             << " ms, sending partial description";
                         EmitLocalDescription();
                       }),
      config_.ice_gathering_timeout);
}

void PeerSession::EmitLocalDescription() {
  awaiting_gathering_ = false;
  if (description_emitted_) {
    return;
  }
  description_emitted_ = true;

  std::string sdp = config_.trickle ? local_sdp_ : transport_->LocalDescription();
  if (sdp.empty()) {
    sdp = local_sdp_;
  }

  SessionEvent event;
  if (local_type_ == webrtc::SdpType::kOffer) {
    SetState(State::kLocalOfferSent);
    event.signal = SignalMessage::Offer(sdp);
  } else {
    if (state_ == State::kRemoteOfferReceived) {
      SetState(State::kLocalAnswerSent);
    }
    event.signal = SignalMessage::Answer(sdp);
  }
  Emit(SessionEventType::kSignal, event);

  if (IsTerminal()) {
    return;
  }
  std::vector<IceCandidate> candidates = std::move(pending_local_candidates_);
  pending_local_candidates_.clear();
  for (const auto& candidate : candidates) {
    SessionEvent candidate_event;
    candidate_event.signal = SignalMessage::Candidate(candidate);
    Emit(SessionEventType::kSignal, candidate_event);
    if (IsTerminal()) {
      return;
    }
  }
}

void PeerSession::StartNegotiationTimer() {
  if (negotiation_timer_armed_) {
    return;
  }
  negotiation_timer_armed_ = true;
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(safety_.flag(),
                       [this]() {
                         if (IsTerminal() || state_ == State::kConnected) {
                           return;
                         }
                         Fail(SwarmErrorType::kNegotiationTimeout,
                              "Handshake did not complete in " +
                                  std::to_string(
                                      config_.negotiation_timeout.ms()) +
                                  " ms");
                       }),
      config_.negotiation_timeout);
}

bool PeerSession::Send(const std::string& data) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (state_ != State::kConnected || !transport_->IsChannelOpen()) {
    return false;
  }
  return transport_->Send(data);
}

void PeerSession::Close() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (IsTerminal()) {
    return;
  }
  RTC_LOG(LS_INFO) << "Closing session with "
                   << (remote_peer_id_.empty() ? "<unknown>" : remote_peer_id_)
                   << " in state " << StateToString(state_);
  SetState(State::kClosed);
  awaiting_gathering_ = false;
  pending_ice_candidates_.clear();
  pending_local_candidates_.clear();
  transport_->Close();
  Emit(SessionEventType::kClose, SessionEvent());
}

void PeerSession::Fail(SwarmErrorType type, const std::string& message) {
  if (IsTerminal()) {
    return;
  }
  RTC_LOG(LS_WARNING) << "Session with "
                      << (remote_peer_id_.empty() ? "<unknown>"
                                                  : remote_peer_id_)
                      << " failed (" << SwarmErrorTypeToString(type)
                      << "): " << message;
  SetState(State::kFailed);
  awaiting_gathering_ = false;
  pending_ice_candidates_.clear();
  pending_local_candidates_.clear();
  transport_->Close();

  SessionEvent event;
  event.error = SwarmError::Make(type, message);
  Emit(SessionEventType::kError, event);
}

void PeerSession::SetState(State state) {
  if (state_ == state) {
    return;
  }
  RTC_LOG(LS_VERBOSE) << "Session " << StateToString(state_) << " -> "
                      << StateToString(state);
  state_ = state;
}

void PeerSession::Emit(SessionEventType type, const SessionEvent& event) {
  // A handler may drop the last external reference to this session.
  std::shared_ptr<PeerSession> self = weak_from_this().lock();
  events_.Emit(type, event);
}

void PeerSession::OnIceGatheringChange(IceGatheringState state) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (state == IceGatheringState::kComplete && awaiting_gathering_ &&
      !IsTerminal()) {
    RTC_LOG(LS_INFO) << "ICE gathering complete";
    EmitLocalDescription();
  }
}

void PeerSession::OnIceCandidate(const IceCandidate& candidate) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (!config_.trickle || IsTerminal()) {
    return;
  }
  if (!description_emitted_) {
    pending_local_candidates_.push_back(candidate);
    return;
  }
  SessionEvent event;
  event.signal = SignalMessage::Candidate(candidate);
  Emit(SessionEventType::kSignal, event);
}

void PeerSession::OnChannelOpen() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (IsTerminal()) {
    return;
  }
  if (state_ == State::kConnected) {
    RTC_LOG(LS_VERBOSE) << "Duplicate channel open ignored";
    return;
  }
  RTC_LOG(LS_INFO) << "Data channel open with "
                   << (remote_peer_id_.empty() ? "<unknown>" : remote_peer_id_);
  SetState(State::kConnected);
  Emit(SessionEventType::kConnect, SessionEvent());
}

void PeerSession::OnChannelClosed() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (IsTerminal()) {
    return;
  }
  if (state_ != State::kConnected) {
    Fail(SwarmErrorType::kNegotiationFailure,
         "Channel closed before it opened");
    return;
  }
  Close();
}

void PeerSession::OnChannelError(const std::string& message) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  Fail(SwarmErrorType::kNegotiationFailure, message);
}

void PeerSession::OnChannelMessage(const std::string& data) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (state_ != State::kConnected) {
    return;
  }
  SessionEvent event;
  event.data = data;
  Emit(SessionEventType::kData, event);
}
