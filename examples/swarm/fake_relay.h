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

#ifndef EXAMPLES_SWARM_FAKE_RELAY_H_
#define EXAMPLES_SWARM_FAKE_RELAY_H_

#include <json/json.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>

#include "relay_channel.h"

class FakeRelayChannel;

// In-process WebTorrent-style tracker. Offers in an announce are forwarded
// to every other peer announced on the same info_hash, answers are routed
// by to_peer_id, and every announce without an answer gets a stats reply.
class FakeRelay {
 public:
  explicit FakeRelay(const std::string& url) : url_(url) {}
  ~FakeRelay();

  const std::string& url() const { return url_; }

  // Connection attempts are refused, or never complete.
  void set_refuse(bool refuse) { refuse_ = refuse; }
  void set_hang(bool hang) { hang_ = hang; }
  void set_send_stats(bool send) { send_stats_ = send; }
  // Offers are accepted but not forwarded.
  void set_forward_offers(bool forward) { forward_offers_ = forward; }

  // Sends text to every open channel, or to the channel of one peer.
  void Inject(const std::string& text);
  void InjectTo(const std::string& peer_id, const Json::Value& message);
  // Drops every channel as if the server went away.
  void Disconnect();

  const std::vector<Json::Value>& received() const { return received_; }
  int announces_from(const std::string& peer_id) const;
  int offers_from(const std::string& peer_id) const;
  int answers_from(const std::string& peer_id) const;
  size_t open_channels() const { return channels_.size(); }

  // Channel side
  bool refuse() const { return refuse_; }
  bool hang() const { return hang_; }
  void Attach(FakeRelayChannel* channel);
  void Detach(FakeRelayChannel* channel);
  void Receive(FakeRelayChannel* channel, const std::string& text);

 private:
  struct Peer {
    FakeRelayChannel* channel = nullptr;
    std::string info_hash;
  };

  const std::string url_;
  bool refuse_ = false;
  bool hang_ = false;
  bool send_stats_ = true;
  bool forward_offers_ = true;
  std::set<FakeRelayChannel*> channels_;
  std::map<std::string, Peer> peers_;
  std::vector<Json::Value> received_;
};

class FakeRelayChannel : public RelayChannel {
 public:
  FakeRelayChannel(const std::string& url, FakeRelay* relay);
  ~FakeRelayChannel() override;

  const std::string& url() const override { return url_; }
  void Connect(webrtc::TimeDelta timeout, ConnectCallback callback) override;
  bool Send(const std::string& text) override;
  void Close() override;
  bool IsOpen() const override { return open_; }
  void SetMessageCallback(MessageCallback callback) override;
  void SetCloseCallback(CloseCallback callback) override;

  // Relay side
  void Deliver(const std::string& text);
  void RemoteClose(const std::string& reason);
  void RelayGone();

 private:
  void FinishConnect(bool ok, const std::string& error);

  const std::string url_;
  FakeRelay* relay_;
  webrtc::TaskQueueBase* const task_queue_;
  bool open_ = false;
  bool closed_ = false;
  ConnectCallback connect_callback_;
  MessageCallback message_callback_;
  CloseCallback close_callback_;
  webrtc::ScopedTaskSafety safety_;
};

// Hands out channels to the relays registered under their url; any other
// url gets a channel to a relay that refuses connections.
class FakeRelayFactory : public RelayChannelFactory {
 public:
  FakeRelay* AddRelay(const std::string& url);
  FakeRelay* relay(const std::string& url);

  std::unique_ptr<RelayChannel> Create(const std::string& url) override;

  int created() const { return created_; }

 private:
  std::map<std::string, std::unique_ptr<FakeRelay>> relays_;
  int created_ = 0;
};

#endif  // EXAMPLES_SWARM_FAKE_RELAY_H_
