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

#ifndef EXAMPLES_SWARM_PEER_TRANSPORT_H_
#define EXAMPLES_SWARM_PEER_TRANSPORT_H_

#include <functional>
#include <memory>
#include <string>

#include <api/jsep.h>
#include <api/rtc_error.h>

#include "swarm.h"

enum class IceGatheringState { kNew, kGathering, kComplete };

// Notifications from a transport. All calls arrive on the thread that owns
// the transport (the signaling thread).
class PeerTransportObserver {
 public:
  virtual ~PeerTransportObserver() = default;

  virtual void OnIceGatheringChange(IceGatheringState state) = 0;
  virtual void OnIceCandidate(const IceCandidate& candidate) = 0;
  virtual void OnChannelOpen() = 0;
  virtual void OnChannelClosed() = 0;
  virtual void OnChannelError(const std::string& message) = 0;
  virtual void OnChannelMessage(const std::string& data) = 0;
};

// Negotiation primitives plus one ordered data channel. Completion callbacks
// are invoked asynchronously on the owning thread.
class PeerTransport {
 public:
  using DescriptionCallback =
      std::function<void(webrtc::RTCError error, const std::string& sdp)>;
  using CompletionCallback = std::function<void(webrtc::RTCError error)>;

  virtual ~PeerTransport() = default;

  virtual void SetObserver(PeerTransportObserver* observer) = 0;

  virtual void CreateOffer(DescriptionCallback callback) = 0;
  virtual void CreateAnswer(DescriptionCallback callback) = 0;
  virtual void SetLocalDescription(webrtc::SdpType type,
                                   const std::string& sdp,
                                   CompletionCallback callback) = 0;
  virtual void SetRemoteDescription(webrtc::SdpType type,
                                    const std::string& sdp,
                                    CompletionCallback callback) = 0;
  // Returns false if the candidate could not be parsed or applied.
  virtual bool AddIceCandidate(const IceCandidate& candidate) = 0;

  // Current local description, including the candidates gathered so far.
  virtual std::string LocalDescription() const = 0;
  virtual IceGatheringState ice_gathering_state() const = 0;
  virtual bool HasRemoteDescription() const = 0;

  virtual bool IsChannelOpen() const = 0;
  virtual bool Send(const std::string& data) = 0;
  virtual void Close() = 0;
};

class PeerTransportFactory {
 public:
  virtual ~PeerTransportFactory() = default;

  // The initiator side owns the data channel; the responder receives it.
  // Returns nullptr on failure.
  virtual std::unique_ptr<PeerTransport> Create(bool initiator) = 0;
};

#endif  // EXAMPLES_SWARM_PEER_TRANSPORT_H_
