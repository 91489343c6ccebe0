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

#include "webrtc_transport.h"

#include <utility>

#include "api/audio_codecs/builtin_audio_decoder_factory.h"
#include "api/audio_codecs/builtin_audio_encoder_factory.h"
#include "api/create_peerconnection_factory.h"
#include "api/jsep.h"
#include "api/task_queue/default_task_queue_factory.h"
#include "api/video_codecs/video_decoder_factory_template.h"
#include "api/video_codecs/video_decoder_factory_template_libvpx_vp8_adapter.h"
#include "api/video_codecs/video_encoder_factory_template.h"
#include "api/video_codecs/video_encoder_factory_template_libvpx_vp8_adapter.h"
#include "rtc_base/event.h"
#include "rtc_base/logging.h"

namespace {

const char kDataChannelLabel[] = "swarm";

}  // namespace

WebRtcPeerTransport::WebRtcPeerTransport(bool initiator)
    : initiator_(initiator), signaling_thread_(rtc::Thread::Current()) {}

WebRtcPeerTransport::~WebRtcPeerTransport() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  observer_ = nullptr;
  Close();
}

bool WebRtcPeerTransport::Open(
    webrtc::PeerConnectionFactoryInterface* factory,
    const webrtc::PeerConnectionInterface::RTCConfiguration& config) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  webrtc::PeerConnectionDependencies pc_dependencies(this);
  auto pc_result =
      factory->CreatePeerConnectionOrError(config, std::move(pc_dependencies));
  if (!pc_result.ok()) {
    RTC_LOG(LS_ERROR) << "Failed to create peer connection: "
                      << pc_result.error().message();
    return false;
  }
  peer_connection_ = pc_result.MoveValue();

  if (initiator_) {
    webrtc::DataChannelInit init;
    init.ordered = true;
    auto dc_result =
        peer_connection_->CreateDataChannelOrError(kDataChannelLabel, &init);
    if (!dc_result.ok()) {
      RTC_LOG(LS_ERROR) << "Failed to create data channel: "
                        << dc_result.error().message();
      return false;
    }
    AttachDataChannel(dc_result.MoveValue());
  }
  RTC_LOG(LS_INFO) << "PeerConnection created ("
                   << (initiator_ ? "initiator" : "responder") << ")";
  return true;
}

void WebRtcPeerTransport::SetObserver(PeerTransportObserver* observer) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  observer_ = observer;
}

void WebRtcPeerTransport::CreateOffer(DescriptionCallback callback) {
  CreateDescription(true, std::move(callback));
}

void WebRtcPeerTransport::CreateAnswer(DescriptionCallback callback) {
  CreateDescription(false, std::move(callback));
}

void WebRtcPeerTransport::CreateDescription(bool offer,
                                            DescriptionCallback callback) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_ || !peer_connection_) {
    signaling_thread_->PostTask(webrtc::SafeTask(safety_.flag(), [callback]() {
      callback(webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                                "transport closed"),
               std::string());
    }));
    return;
  }

  auto flag = safety_.flag();
  rtc::Thread* thread = signaling_thread_;
  auto observer = rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
      [thread, flag, callback](
          std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
        std::string sdp;
        desc->ToString(&sdp);
        thread->PostTask(webrtc::SafeTask(flag, [callback, sdp]() {
          callback(webrtc::RTCError::OK(), sdp);
        }));
      },
      [thread, flag, callback](webrtc::RTCError error) {
        thread->PostTask(webrtc::SafeTask(flag, [callback, error]() {
          callback(error, std::string());
        }));
      });

  webrtc::PeerConnectionInterface::RTCOfferAnswerOptions options;
  if (offer) {
    peer_connection_->CreateOffer(observer.get(), options);
  } else {
    peer_connection_->CreateAnswer(observer.get(), options);
  }
}

void WebRtcPeerTransport::SetLocalDescription(webrtc::SdpType type,
                                              const std::string& sdp,
                                              CompletionCallback callback) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
      webrtc::CreateSessionDescription(type, sdp, &parse_error);
  if (closed_ || !peer_connection_ || !desc) {
    webrtc::RTCError error =
        desc ? webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                                "transport closed")
             : webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                                parse_error.description);
    signaling_thread_->PostTask(webrtc::SafeTask(
        safety_.flag(), [callback, error]() { callback(error); }));
    return;
  }

  auto flag = safety_.flag();
  rtc::Thread* thread = signaling_thread_;
  peer_connection_->SetLocalDescription(
      std::move(desc),
      rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
          [thread, flag, callback](webrtc::RTCError error) {
            thread->PostTask(webrtc::SafeTask(
                flag, [callback, error]() { callback(error); }));
          }));
}

void WebRtcPeerTransport::SetRemoteDescription(webrtc::SdpType type,
                                               const std::string& sdp,
                                               CompletionCallback callback) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::SessionDescriptionInterface> desc =
      webrtc::CreateSessionDescription(type, sdp, &parse_error);
  if (closed_ || !peer_connection_ || !desc) {
    webrtc::RTCError error =
        desc ? webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE,
                                "transport closed")
             : webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                                "Failed to parse remote SDP: " +
                                    parse_error.description);
    signaling_thread_->PostTask(webrtc::SafeTask(
        safety_.flag(), [callback, error]() { callback(error); }));
    return;
  }

  auto flag = safety_.flag();
  rtc::Thread* thread = signaling_thread_;
  peer_connection_->SetRemoteDescription(
      std::move(desc),
      rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(
          [thread, flag, callback](webrtc::RTCError error) {
            thread->PostTask(webrtc::SafeTask(
                flag, [callback, error]() { callback(error); }));
          }));
}

bool WebRtcPeerTransport::AddIceCandidate(const IceCandidate& candidate) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_ || !peer_connection_) {
    return false;
  }
  webrtc::SdpParseError error;
  std::unique_ptr<webrtc::IceCandidateInterface> ice_candidate(
      webrtc::CreateIceCandidate(candidate.sdp_mid, candidate.sdp_mline_index,
                                 candidate.candidate, &error));
  if (!ice_candidate) {
    RTC_LOG(LS_WARNING) << "Can't parse received candidate message: "
                        << error.description;
    return false;
  }
  return peer_connection_->AddIceCandidate(ice_candidate.get());
}

std::string WebRtcPeerTransport::LocalDescription() const {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  std::string sdp;
  if (peer_connection_ && peer_connection_->local_description()) {
    peer_connection_->local_description()->ToString(&sdp);
  }
  return sdp;
}

IceGatheringState WebRtcPeerTransport::ice_gathering_state() const {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (!peer_connection_) {
    return IceGatheringState::kNew;
  }
  switch (peer_connection_->ice_gathering_state()) {
    case webrtc::PeerConnectionInterface::kIceGatheringGathering:
      return IceGatheringState::kGathering;
    case webrtc::PeerConnectionInterface::kIceGatheringComplete:
      return IceGatheringState::kComplete;
    default:
      return IceGatheringState::kNew;
  }
}

bool WebRtcPeerTransport::HasRemoteDescription() const {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  return peer_connection_ && peer_connection_->remote_description() != nullptr;
}

bool WebRtcPeerTransport::IsChannelOpen() const {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  return channel_open_ && data_channel_ &&
         data_channel_->state() == webrtc::DataChannelInterface::kOpen;
}

bool WebRtcPeerTransport::Send(const std::string& data) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (!IsChannelOpen()) {
    return false;
  }
  return data_channel_->Send(webrtc::DataBuffer(data));
}

void WebRtcPeerTransport::Close() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_) {
    return;
  }
  closed_ = true;
  channel_open_ = false;
  if (data_channel_) {
    data_channel_->UnregisterObserver();
    data_channel_->Close();
    data_channel_ = nullptr;
  }
  if (peer_connection_) {
    peer_connection_->Close();
    peer_connection_ = nullptr;
  }
}

void WebRtcPeerTransport::AttachDataChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  data_channel_ = std::move(channel);
  data_channel_->RegisterObserver(this);
  RTC_LOG(LS_INFO) << "Data channel " << data_channel_->label() << " attached";
}

void WebRtcPeerTransport::OnSignalingChange(
    webrtc::PeerConnectionInterface::SignalingState new_state) {
  RTC_LOG(LS_VERBOSE) << "Signaling state: "
                      << webrtc::PeerConnectionInterface::AsString(new_state);
}

void WebRtcPeerTransport::OnDataChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_) {
    return;
  }
  if (initiator_ || data_channel_) {
    RTC_LOG(LS_WARNING) << "Unexpected data channel " << channel->label()
                        << ", closing it";
    channel->Close();
    return;
  }
  AttachDataChannel(std::move(channel));
  // The channel may already be open when it is handed over.
  OnStateChange();
}

void WebRtcPeerTransport::OnIceGatheringChange(
    webrtc::PeerConnectionInterface::IceGatheringState new_state) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  RTC_LOG(LS_VERBOSE) << "ICE gathering state: "
                      << webrtc::PeerConnectionInterface::AsString(new_state);
  if (closed_ || !observer_) {
    return;
  }
  switch (new_state) {
    case webrtc::PeerConnectionInterface::kIceGatheringGathering:
      observer_->OnIceGatheringChange(IceGatheringState::kGathering);
      break;
    case webrtc::PeerConnectionInterface::kIceGatheringComplete:
      observer_->OnIceGatheringChange(IceGatheringState::kComplete);
      break;
    default:
      observer_->OnIceGatheringChange(IceGatheringState::kNew);
      break;
  }
}

void WebRtcPeerTransport::OnIceCandidate(
    const webrtc::IceCandidateInterface* candidate) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_ || !observer_) {
    return;
  }
  IceCandidate out;
  out.sdp_mid = candidate->sdp_mid();
  out.sdp_mline_index = candidate->sdp_mline_index();
  if (!candidate->ToString(&out.candidate)) {
    RTC_LOG(LS_WARNING) << "Failed to serialize candidate";
    return;
  }
  observer_->OnIceCandidate(out);
}

void WebRtcPeerTransport::OnConnectionChange(
    webrtc::PeerConnectionInterface::PeerConnectionState new_state) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  RTC_LOG(LS_INFO) << "Peer connection state: "
                   << webrtc::PeerConnectionInterface::AsString(new_state);
  if (closed_ || !observer_) {
    return;
  }
  if (new_state == webrtc::PeerConnectionInterface::PeerConnectionState::kFailed) {
    observer_->OnChannelError("Peer connection failed");
  }
}

void WebRtcPeerTransport::OnStateChange() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_ || !data_channel_) {
    return;
  }
  webrtc::DataChannelInterface::DataState state = data_channel_->state();
  RTC_LOG(LS_INFO) << "Data channel state: "
                   << webrtc::DataChannelInterface::DataStateString(state);
  if (state == webrtc::DataChannelInterface::kOpen) {
    channel_open_ = true;
    if (observer_) {
      observer_->OnChannelOpen();
    }
  } else if (state == webrtc::DataChannelInterface::kClosed && channel_open_) {
    channel_open_ = false;
    if (observer_) {
      observer_->OnChannelClosed();
    }
  }
}

void WebRtcPeerTransport::OnMessage(const webrtc::DataBuffer& buffer) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (closed_ || !observer_) {
    return;
  }
  observer_->OnChannelMessage(
      std::string(buffer.data.data<char>(), buffer.data.size()));
}

WebRtcTransportFactory::WebRtcTransportFactory(
    const std::vector<std::string>& ice_servers)
    : ice_servers_(ice_servers) {}

WebRtcTransportFactory::~WebRtcTransportFactory() {
  peer_connection_factory_ = nullptr;
  if (worker_thread_) {
    // ADM is created and released on the worker thread.
    worker_thread_->BlockingCall([this]() { audio_device_module_ = nullptr; });
  }
  if (network_thread_) {
    network_thread_->Stop();
  }
  if (worker_thread_) {
    worker_thread_->Stop();
  }
}

bool WebRtcTransportFactory::Initialize() {
  rtc::Thread* signaling_thread = rtc::Thread::Current();
  if (!signaling_thread) {
    RTC_LOG(LS_ERROR) << "Initialize must run on an rtc::Thread";
    return false;
  }

  network_thread_ = rtc::Thread::CreateWithSocketServer();
  network_thread_->SetName("swarm_network", nullptr);
  worker_thread_ = rtc::Thread::Create();
  worker_thread_->SetName("swarm_worker", nullptr);
  if (!network_thread_->Start() || !worker_thread_->Start()) {
    RTC_LOG(LS_ERROR) << "Failed to start threads";
    return false;
  }

  std::unique_ptr<webrtc::TaskQueueFactory> task_queue_factory =
      webrtc::CreateDefaultTaskQueueFactory();
  webrtc::TaskQueueFactory* task_queue_factory_ptr = task_queue_factory.get();

  // No media flows; a dummy ADM keeps the voice engine satisfied.
  rtc::Event adm_created;
  worker_thread_->PostTask([this, task_queue_factory_ptr, &adm_created]() {
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kDummyAudio, task_queue_factory_ptr);
    if (audio_device_module_ && audio_device_module_->Init() != 0) {
      RTC_LOG(LS_ERROR) << "Dummy audio device module Init failed";
      audio_device_module_ = nullptr;
    }
    adm_created.Set();
  });
  adm_created.Wait(webrtc::TimeDelta::Seconds(1));
  if (!audio_device_module_) {
    RTC_LOG(LS_ERROR) << "Audio device module creation failed";
    return false;
  }

  peer_connection_factory_ = webrtc::CreatePeerConnectionFactory(
      network_thread_.get(), worker_thread_.get(), signaling_thread,
      audio_device_module_, webrtc::CreateBuiltinAudioEncoderFactory(),
      webrtc::CreateBuiltinAudioDecoderFactory(),
      std::make_unique<webrtc::VideoEncoderFactoryTemplate<
          webrtc::LibvpxVp8EncoderTemplateAdapter>>(),
      std::make_unique<webrtc::VideoDecoderFactoryTemplate<
          webrtc::LibvpxVp8DecoderTemplateAdapter>>(),
      nullptr,  // audio_mixer
      nullptr   // audio_processing
  );
  if (!peer_connection_factory_) {
    RTC_LOG(LS_ERROR) << "Failed to create PeerConnectionFactory";
    return false;
  }
  RTC_LOG(LS_INFO) << "PeerConnectionFactory ready with " << ice_servers_.size()
                   << " ICE servers";
  return true;
}

std::unique_ptr<PeerTransport> WebRtcTransportFactory::Create(bool initiator) {
  if (!peer_connection_factory_) {
    RTC_LOG(LS_ERROR) << "Transport factory not initialized";
    return nullptr;
  }

  webrtc::PeerConnectionInterface::RTCConfiguration config;
  config.sdp_semantics = webrtc::SdpSemantics::kUnifiedPlan;
  for (const auto& url : ice_servers_) {
    webrtc::PeerConnectionInterface::IceServer server;
    server.uri = url;
    config.servers.push_back(server);
  }

  auto transport = std::make_unique<WebRtcPeerTransport>(initiator);
  if (!transport->Open(peer_connection_factory_.get(), config)) {
    return nullptr;
  }
  return transport;
}
