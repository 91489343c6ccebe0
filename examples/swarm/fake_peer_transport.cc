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

#include "fake_peer_transport.h"

#include <cstdlib>
#include <utility>

namespace {

const char kOfferPrefix[] = "fake-offer:";
const char kAnswerPrefix[] = "fake-answer:";
const char kGatheredSuffix[] = " +candidates";

}  // namespace

int FakeSdpTransportId(const std::string& sdp) {
  if (sdp.rfind(kOfferPrefix, 0) != 0 && sdp.rfind(kAnswerPrefix, 0) != 0) {
    return 0;
  }
  size_t colon = sdp.find(':');
  return std::atoi(sdp.c_str() + colon + 1);
}

int FakeTransportNetwork::Register(FakePeerTransport* transport) {
  int id = next_id_++;
  transports_[id] = transport;
  return id;
}

void FakeTransportNetwork::Unregister(int id) {
  transports_.erase(id);
}

FakePeerTransport* FakeTransportNetwork::Find(int id) const {
  auto it = transports_.find(id);
  return it == transports_.end() ? nullptr : it->second;
}

void FakeTransportNetwork::Link(int initiator_id, int responder_id) {
  FakePeerTransport* initiator = Find(initiator_id);
  FakePeerTransport* responder = Find(responder_id);
  if (!initiator || !responder) {
    return;
  }
  ++links_;
  initiator->OpenChannel();
  responder->OpenChannel();
}

FakePeerTransport::FakePeerTransport(FakeTransportNetwork* network,
                                     bool initiator,
                                     const FakeTransportOptions& options)
    : network_(network),
      initiator_(initiator),
      options_(options),
      task_queue_(webrtc::TaskQueueBase::Current()) {
  id_ = network_->Register(this);
}

FakePeerTransport::~FakePeerTransport() {
  network_->Unregister(id_);
}

void FakePeerTransport::SetObserver(PeerTransportObserver* observer) {
  observer_ = observer;
}

void FakePeerTransport::CreateOffer(DescriptionCallback callback) {
  const bool fail = options_.fail_create_offer || closed_;
  const std::string sdp = kOfferPrefix + std::to_string(id_);
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [fail, sdp, callback]() {
    if (fail) {
      callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR,
                                "offer refused"),
               std::string());
      return;
    }
    callback(webrtc::RTCError::OK(), sdp);
  }));
}

void FakePeerTransport::CreateAnswer(DescriptionCallback callback) {
  const bool fail = options_.fail_create_answer || closed_;
  const std::string sdp = kAnswerPrefix + std::to_string(id_);
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [fail, sdp, callback]() {
    if (fail) {
      callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR,
                                "answer refused"),
               std::string());
      return;
    }
    callback(webrtc::RTCError::OK(), sdp);
  }));
}

void FakePeerTransport::SetLocalDescription(webrtc::SdpType type,
                                            const std::string& sdp,
                                            CompletionCallback callback) {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, sdp, callback]() {
    local_sdp_ = sdp;
    callback(webrtc::RTCError::OK());
  }));
  // Queued behind the completion above.
  task_queue_->PostTask(
      webrtc::SafeTask(safety_.flag(), [this]() { StartGathering(); }));
}

void FakePeerTransport::StartGathering() {
  if (closed_ || gathering_ != IceGatheringState::kNew) {
    return;
  }
  gathering_ = IceGatheringState::kGathering;
  if (observer_) {
    observer_->OnIceGatheringChange(gathering_);
  }
  for (int i = 0; i < options_.local_candidates; ++i) {
    if (closed_ || !observer_) {
      return;
    }
    IceCandidate candidate;
    candidate.sdp_mid = "0";
    candidate.sdp_mline_index = 0;
    candidate.candidate = "candidate:" + std::to_string(id_) + "-" +
                          std::to_string(i) + " 1 udp 1 127.0.0.1 9 typ host";
    observer_->OnIceCandidate(candidate);
  }
  if (options_.never_complete_gathering || closed_) {
    return;
  }
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
    if (closed_) {
      return;
    }
    gathering_ = IceGatheringState::kComplete;
    if (observer_) {
      observer_->OnIceGatheringChange(gathering_);
    }
  }));
}

void FakePeerTransport::SetRemoteDescription(webrtc::SdpType type,
                                             const std::string& sdp,
                                             CompletionCallback callback) {
  if (options_.fail_set_remote || closed_) {
    task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [callback]() {
      callback(webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                                "remote description rejected"));
    }));
    return;
  }
  const int remote_id = FakeSdpTransportId(sdp);
  task_queue_->PostTask(
      webrtc::SafeTask(safety_.flag(), [this, remote_id, callback]() {
        has_remote_ = true;
        remote_id_ = remote_id;
        callback(webrtc::RTCError::OK());
      }));
  if (type == webrtc::SdpType::kAnswer && initiator_) {
    task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, remote_id]() {
      if (!closed_) {
        network_->Link(id_, remote_id);
      }
    }));
  }
}

bool FakePeerTransport::AddIceCandidate(const IceCandidate& candidate) {
  if (options_.fail_add_candidate || closed_) {
    return false;
  }
  added_candidates_.push_back(candidate);
  return true;
}

std::string FakePeerTransport::LocalDescription() const {
  if (local_sdp_.empty()) {
    return std::string();
  }
  return gathering_ == IceGatheringState::kComplete
             ? local_sdp_ + kGatheredSuffix
             : local_sdp_;
}

bool FakePeerTransport::Send(const std::string& data) {
  if (!channel_open_ || closed_) {
    return false;
  }
  sent_.push_back(data);
  FakePeerTransport* peer = network_->Find(remote_id_);
  if (peer) {
    peer->DeliverMessage(data);
  }
  return true;
}

void FakePeerTransport::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  network_->NoteClosed(id_);
  const bool was_open = channel_open_;
  channel_open_ = false;
  if (was_open) {
    FakePeerTransport* peer = network_->Find(remote_id_);
    if (peer) {
      peer->RemoteClosed();
    }
  }
}

void FakePeerTransport::OpenChannel() {
  if (closed_ || options_.never_open) {
    return;
  }
  const int deliveries = options_.double_open ? 2 : 1;
  for (int i = 0; i < deliveries; ++i) {
    task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
      if (closed_) {
        return;
      }
      channel_open_ = true;
      if (observer_) {
        observer_->OnChannelOpen();
      }
    }));
  }
}

void FakePeerTransport::DeliverMessage(const std::string& data) {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, data]() {
    if (closed_ || !channel_open_ || !observer_) {
      return;
    }
    observer_->OnChannelMessage(data);
  }));
}

void FakePeerTransport::RemoteClosed() {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
    if (closed_ || !channel_open_) {
      return;
    }
    channel_open_ = false;
    if (observer_) {
      observer_->OnChannelClosed();
    }
  }));
}

void FakePeerTransport::InjectError(const std::string& message) {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, message]() {
    if (!closed_ && observer_) {
      observer_->OnChannelError(message);
    }
  }));
}

std::unique_ptr<PeerTransport> FakePeerTransportFactory::Create(bool initiator) {
  if (fail_create_) {
    return nullptr;
  }
  auto transport =
      std::make_unique<FakePeerTransport>(network_, initiator, options_);
  ++created_;
  created_ids_.push_back(transport->id());
  return transport;
}
