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

#include "fake_relay.h"

#include <utility>

#include "status.h"
#include "tracker.h"
#include "utils.h"

FakeRelay::~FakeRelay() {
  for (FakeRelayChannel* channel : channels_) {
    channel->RelayGone();
  }
}

void FakeRelay::Inject(const std::string& text) {
  for (FakeRelayChannel* channel : channels_) {
    channel->Deliver(text);
  }
}

void FakeRelay::InjectTo(const std::string& peer_id, const Json::Value& message) {
  auto it = peers_.find(peer_id);
  if (it != peers_.end()) {
    it->second.channel->Deliver(WriteRelayMessage(message));
  }
}

void FakeRelay::Disconnect() {
  std::set<FakeRelayChannel*> channels = std::move(channels_);
  channels_.clear();
  peers_.clear();
  for (FakeRelayChannel* channel : channels) {
    channel->RemoteClose("relay went away");
  }
}

int FakeRelay::announces_from(const std::string& peer_id) const {
  int count = 0;
  for (const auto& message : received_) {
    if (message[Tracker::kPeerId].asString() == peer_id &&
        !message.isMember(Tracker::kAnswer)) {
      ++count;
    }
  }
  return count;
}

int FakeRelay::offers_from(const std::string& peer_id) const {
  int count = 0;
  for (const auto& message : received_) {
    if (message[Tracker::kPeerId].asString() == peer_id &&
        message[Tracker::kOffers].isArray()) {
      count += static_cast<int>(message[Tracker::kOffers].size());
    }
  }
  return count;
}

int FakeRelay::answers_from(const std::string& peer_id) const {
  int count = 0;
  for (const auto& message : received_) {
    if (message[Tracker::kPeerId].asString() == peer_id &&
        message.isMember(Tracker::kAnswer)) {
      ++count;
    }
  }
  return count;
}

void FakeRelay::Attach(FakeRelayChannel* channel) {
  channels_.insert(channel);
}

void FakeRelay::Detach(FakeRelayChannel* channel) {
  channels_.erase(channel);
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (it->second.channel == channel) {
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
}

void FakeRelay::Receive(FakeRelayChannel* channel, const std::string& text) {
  Json::Value message;
  std::string error;
  if (!ParseRelayMessage(text, &message, &error)) {
    return;
  }
  received_.push_back(message);
  if (message[Tracker::kAction].asString() != Tracker::kAnnounce) {
    return;
  }

  const std::string peer_id = message[Tracker::kPeerId].asString();
  const std::string info_hash = message[Tracker::kInfoHash].asString();
  peers_[peer_id] = Peer{channel, info_hash};

  if (message.isMember(Tracker::kAnswer)) {
    auto target = peers_.find(message[Tracker::kToPeerId].asString());
    if (target == peers_.end()) {
      return;
    }
    Json::Value forward(Json::objectValue);
    forward[Tracker::kAction] = Tracker::kAnnounce;
    forward[Tracker::kInfoHash] = info_hash;
    forward[Tracker::kPeerId] = peer_id;
    forward[Tracker::kToPeerId] = message[Tracker::kToPeerId];
    forward[Tracker::kOfferId] = message[Tracker::kOfferId];
    forward[Tracker::kAnswer] = message[Tracker::kAnswer];
    target->second.channel->Deliver(WriteRelayMessage(forward));
    return;
  }

  int swarm_size = 0;
  for (const auto& entry : peers_) {
    if (entry.second.info_hash == info_hash) {
      ++swarm_size;
    }
  }

  if (forward_offers_ && message[Tracker::kOffers].isArray()) {
    for (const auto& offer : message[Tracker::kOffers]) {
      for (const auto& entry : peers_) {
        if (entry.first == peer_id || entry.second.info_hash != info_hash) {
          continue;
        }
        Json::Value forward(Json::objectValue);
        forward[Tracker::kAction] = Tracker::kAnnounce;
        forward[Tracker::kInfoHash] = info_hash;
        forward[Tracker::kPeerId] = peer_id;
        forward[Tracker::kOfferId] = offer[Tracker::kOfferId];
        forward[Tracker::kOffer] = offer[Tracker::kOffer];
        entry.second.channel->Deliver(WriteRelayMessage(forward));
      }
    }
  }

  if (send_stats_) {
    Json::Value stats(Json::objectValue);
    stats[Tracker::kAction] = Tracker::kAnnounce;
    stats[Tracker::kInfoHash] = info_hash;
    stats[Tracker::kInterval] = 120;
    stats[Tracker::kComplete] = 0;
    stats[Tracker::kIncomplete] = swarm_size;
    channel->Deliver(WriteRelayMessage(stats));
  }
}

FakeRelayChannel::FakeRelayChannel(const std::string& url, FakeRelay* relay)
    : url_(url), relay_(relay), task_queue_(webrtc::TaskQueueBase::Current()) {}

FakeRelayChannel::~FakeRelayChannel() {
  if (relay_) {
    relay_->Detach(this);
  }
}

void FakeRelayChannel::Connect(webrtc::TimeDelta timeout, ConnectCallback callback) {
  connect_callback_ = std::move(callback);
  if (!relay_ || relay_->refuse()) {
    task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
      FinishConnect(false, "connection refused");
    }));
    return;
  }
  if (relay_->hang()) {
    task_queue_->PostDelayedTask(webrtc::SafeTask(safety_.flag(),
                                                  [this]() {
                                                    FinishConnect(false, "timed out");
                                                  }),
                                 timeout);
    return;
  }
  task_queue_->PostTask(webrtc::SafeTask(
      safety_.flag(), [this]() { FinishConnect(true, std::string()); }));
}

void FakeRelayChannel::FinishConnect(bool ok, const std::string& error) {
  if (!connect_callback_ || closed_) {
    return;
  }
  ConnectCallback callback = std::move(connect_callback_);
  connect_callback_ = nullptr;
  if (ok && relay_) {
    open_ = true;
    relay_->Attach(this);
  }
  callback(ok && relay_ != nullptr, error);
}

bool FakeRelayChannel::Send(const std::string& text) {
  if (!open_ || !relay_) {
    return false;
  }
  relay_->Receive(this, text);
  return true;
}

void FakeRelayChannel::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  open_ = false;
  connect_callback_ = nullptr;
  message_callback_ = nullptr;
  close_callback_ = nullptr;
  if (relay_) {
    relay_->Detach(this);
  }
}

void FakeRelayChannel::SetMessageCallback(MessageCallback callback) {
  message_callback_ = std::move(callback);
}

void FakeRelayChannel::SetCloseCallback(CloseCallback callback) {
  close_callback_ = std::move(callback);
}

void FakeRelayChannel::Deliver(const std::string& text) {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, text]() {
    if (!open_ || !message_callback_) {
      return;
    }
    auto callback = message_callback_;
    callback(text);
  }));
}

void FakeRelayChannel::RemoteClose(const std::string& reason) {
  task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this, reason]() {
    if (!open_) {
      return;
    }
    open_ = false;
    if (relay_) {
      relay_->Detach(this);
    }
    if (close_callback_) {
      auto callback = close_callback_;
      callback(reason);
    }
  }));
}

void FakeRelayChannel::RelayGone() {
  relay_ = nullptr;
}

FakeRelay* FakeRelayFactory::AddRelay(const std::string& url) {
  auto& relay = relays_[url];
  if (!relay) {
    relay = std::make_unique<FakeRelay>(url);
  }
  return relay.get();
}

FakeRelay* FakeRelayFactory::relay(const std::string& url) {
  auto it = relays_.find(url);
  return it == relays_.end() ? nullptr : it->second.get();
}

std::unique_ptr<RelayChannel> FakeRelayFactory::Create(const std::string& url) {
  if (!ParseRelayUrl(url, nullptr)) {
    return nullptr;
  }
  FakeRelay* target = relay(url);
  if (!target) {
    target = AddRelay(url);
    target->set_refuse(true);
  }
  ++created_;
  return std::make_unique<FakeRelayChannel>(url, target);
}
