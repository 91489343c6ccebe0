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

#ifndef EXAMPLES_SWARM_FAKE_PEER_TRANSPORT_H_
#define EXAMPLES_SWARM_FAKE_PEER_TRANSPORT_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>

#include "peer_transport.h"

class FakePeerTransport;

// Behaviour switches applied to every transport a factory creates.
struct FakeTransportOptions {
  bool fail_create_offer = false;
  bool fail_create_answer = false;
  bool fail_set_remote = false;
  bool never_complete_gathering = false;
  // Channel never opens even after offer and answer are applied.
  bool never_open = false;
  // OnChannelOpen is delivered twice.
  bool double_open = false;
  bool fail_add_candidate = false;
  // Local candidates reported through OnIceCandidate while gathering.
  int local_candidates = 0;
};

// In-process stand-in for the network between fake transports. The offer
// sdp "fake-offer:N" names transport N; once the initiator applies the
// answer "fake-answer:M" transports N and M are linked and both channels
// open.
class FakeTransportNetwork {
 public:
  int Register(FakePeerTransport* transport);
  void Unregister(int id);
  FakePeerTransport* Find(int id) const;
  void Link(int initiator_id, int responder_id);
  void NoteClosed(int id) { closed_ids_.insert(id); }

  int transport_count() const { return static_cast<int>(transports_.size()); }
  int links() const { return links_; }
  // Close() was called on transport |id|, whether or not it still exists.
  bool WasClosed(int id) const { return closed_ids_.count(id) > 0; }

 private:
  int next_id_ = 1;
  int links_ = 0;
  std::map<int, FakePeerTransport*> transports_;
  std::set<int> closed_ids_;
};

class FakePeerTransport : public PeerTransport {
 public:
  FakePeerTransport(FakeTransportNetwork* network,
                    bool initiator,
                    const FakeTransportOptions& options);
  ~FakePeerTransport() override;

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
  IceGatheringState ice_gathering_state() const override { return gathering_; }
  bool HasRemoteDescription() const override { return has_remote_; }
  bool IsChannelOpen() const override { return channel_open_; }
  bool Send(const std::string& data) override;
  void Close() override;

  int id() const { return id_; }
  bool initiator() const { return initiator_; }
  bool closed() const { return closed_; }
  const std::vector<IceCandidate>& added_candidates() const {
    return added_candidates_;
  }
  const std::vector<std::string>& sent() const { return sent_; }

  // Network side
  void OpenChannel();
  void DeliverMessage(const std::string& data);
  void RemoteClosed();
  // Simulates a transport level failure.
  void InjectError(const std::string& message);

 private:
  void StartGathering();

  FakeTransportNetwork* const network_;
  const bool initiator_;
  const FakeTransportOptions options_;
  webrtc::TaskQueueBase* const task_queue_;
  int id_ = 0;
  int remote_id_ = 0;
  PeerTransportObserver* observer_ = nullptr;
  std::string local_sdp_;
  bool has_remote_ = false;
  bool channel_open_ = false;
  bool closed_ = false;
  IceGatheringState gathering_ = IceGatheringState::kNew;
  std::vector<IceCandidate> added_candidates_;
  std::vector<std::string> sent_;
  webrtc::ScopedTaskSafety safety_;
};

class FakePeerTransportFactory : public PeerTransportFactory {
 public:
  explicit FakePeerTransportFactory(FakeTransportNetwork* network)
      : network_(network) {}

  std::unique_ptr<PeerTransport> Create(bool initiator) override;

  FakeTransportOptions& options() { return options_; }
  void set_fail_create(bool fail) { fail_create_ = fail; }
  int created() const { return created_; }
  // Most recently created transports, in creation order; entries may be
  // dangling once a session has gone.
  const std::vector<int>& created_ids() const { return created_ids_; }

 private:
  FakeTransportNetwork* const network_;
  FakeTransportOptions options_;
  bool fail_create_ = false;
  int created_ = 0;
  std::vector<int> created_ids_;
};

// Id encoded in a fake sdp, 0 if it is not one.
int FakeSdpTransportId(const std::string& sdp);

#endif  // EXAMPLES_SWARM_FAKE_PEER_TRANSPORT_H_
