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

#ifndef EXAMPLES_SWARM_WEBRTC_TRANSPORT_H_
#define EXAMPLES_SWARM_WEBRTC_TRANSPORT_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <absl/memory/memory.h>
#include <api/data_channel_interface.h>
#include <api/peer_connection_interface.h>
#include <api/scoped_refptr.h>
#include <api/sequence_checker.h>
#include <api/task_queue/pending_task_safety_flag.h>
#include <modules/audio_device/include/audio_device.h>
#include <rtc_base/thread.h>

#include "peer_transport.h"
#include "swarm.h"

class LambdaCreateSessionDescriptionObserver
    : public webrtc::CreateSessionDescriptionObserver {
 public:
  LambdaCreateSessionDescriptionObserver(
      std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface>
                             desc)> on_success,
      std::function<void(webrtc::RTCError)> on_failure)
      : on_success_(on_success), on_failure_(on_failure) {}
  void OnSuccess(webrtc::SessionDescriptionInterface* desc) override {
    // Takes ownership of desc, according to CreateSessionDescriptionObserver
    // convention.
    on_success_(absl::WrapUnique(desc));
  }
  void OnFailure(webrtc::RTCError error) override {
    on_failure_(std::move(error));
  }

 private:
  std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)>
      on_success_;
  std::function<void(webrtc::RTCError)> on_failure_;
};

class LambdaSetLocalDescriptionObserver
    : public webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit LambdaSetLocalDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetLocalDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

class LambdaSetRemoteDescriptionObserver
    : public webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit LambdaSetRemoteDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetRemoteDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

// PeerTransport on a libwebrtc PeerConnection with one ordered data channel
// and no media. Lives on the signaling thread.
class SWARM_API WebRtcPeerTransport : public PeerTransport,
                                      public webrtc::PeerConnectionObserver,
                                      public webrtc::DataChannelObserver {
 public:
  explicit WebRtcPeerTransport(bool initiator);
  ~WebRtcPeerTransport() override;

  bool Open(webrtc::PeerConnectionFactoryInterface* factory,
            const webrtc::PeerConnectionInterface::RTCConfiguration& config);

  // PeerTransport
  void SetObserver(PeerTransportObserver* observer) override;
  void CreateOffer(DescriptionCallback callback) override;
  void CreateAnswer(DescriptionCallback callback) override;
  void SetLocalDescription(webrtc::SdpType type,
                           const std::string& sdp,
                           CompletionCallback callback) override;
  void SetRemoteDescription(webrtc::SdpType type,
                            const std::string& sdp,
                            CompletionCallback callback) override;
  bool AddIceCandidate(const IceCandidate& candidate) override;
  std::string LocalDescription() const override;
  IceGatheringState ice_gathering_state() const override;
  bool HasRemoteDescription() const override;
  bool IsChannelOpen() const override;
  bool Send(const std::string& data) override;
  void Close() override;

  // PeerConnectionObserver
  void OnSignalingChange(
      webrtc::PeerConnectionInterface::SignalingState new_state) override;
  void OnDataChannel(
      rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override;
  void OnIceGatheringChange(
      webrtc::PeerConnectionInterface::IceGatheringState new_state) override;
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;
  void OnConnectionChange(
      webrtc::PeerConnectionInterface::PeerConnectionState new_state) override;

  // DataChannelObserver
  void OnStateChange() override;
  void OnMessage(const webrtc::DataBuffer& buffer) override;

 private:
  void CreateDescription(bool offer, DescriptionCallback callback);
  void AttachDataChannel(rtc::scoped_refptr<webrtc::DataChannelInterface> channel);

  webrtc::SequenceChecker sequence_checker_;
  const bool initiator_;
  rtc::Thread* const signaling_thread_;
  PeerTransportObserver* observer_ = nullptr;
  bool closed_ = false;
  bool channel_open_ = false;

  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  rtc::scoped_refptr<webrtc::DataChannelInterface> data_channel_;
  webrtc::ScopedTaskSafety safety_;
};

// Owns the PeerConnectionFactory and its network and worker threads. The
// calling thread becomes the signaling thread. Transports must be destroyed
// before the factory.
class SWARM_API WebRtcTransportFactory : public PeerTransportFactory {
 public:
  explicit WebRtcTransportFactory(const std::vector<std::string>& ice_servers);
  ~WebRtcTransportFactory() override;

  bool Initialize();

  std::unique_ptr<PeerTransport> Create(bool initiator) override;

 private:
  const std::vector<std::string> ice_servers_;
  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<rtc::Thread> worker_thread_;
  rtc::scoped_refptr<webrtc::AudioDeviceModule> audio_device_module_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> peer_connection_factory_;
};

#endif  // EXAMPLES_SWARM_WEBRTC_TRANSPORT_H_
