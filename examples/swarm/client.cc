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

#include "client.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <api/units/time_delta.h>
#include <rtc_base/checks.h>
#include <rtc_base/logging.h>
#include <rtc_base/time_utils.h>

#include "status.h"
#include "utils.h"

namespace {

int readCount(const Json::Value& message, const char* key) {
  const Json::Value& value = message[key];
  return value.isInt() ? value.asInt() : 0;
}

}  // namespace

const char* DiscoveryEventTypeToString(DiscoveryEventType type) {
  switch (type) {
    case DiscoveryEventType::kReady:
      return "ready";
    case DiscoveryEventType::kPeerConnected:
      return "peer-connected";
    case DiscoveryEventType::kPeerFailed:
      return "peer-failed";
    case DiscoveryEventType::kPeerDisconnected:
      return "peer-disconnected";
    case DiscoveryEventType::kStatsUpdate:
      return "stats";
    case DiscoveryEventType::kScrape:
      return "scrape";
    case DiscoveryEventType::kRelayFailure:
      return "relay-failure";
    case DiscoveryEventType::kError:
      return "error";
    case DiscoveryEventType::kClosed:
      return "closed";
  }
  return "unknown";
}

PeerDiscoveryClient::PeerDiscoveryClient(const SwarmOptions& options,
                                         PeerTransportFactory* transport_factory,
                                         RelayChannelFactory* relay_factory)
    : task_queue_(webrtc::TaskQueueBase::Current()),
      options_(options),
      transport_factory_(transport_factory),
      relay_factory_(relay_factory) {
  RTC_DCHECK(task_queue_);
  RTC_DCHECK(transport_factory_);
  RTC_DCHECK(relay_factory_);
  SwarmResolveOptions(&options_);
}

PeerDiscoveryClient::~PeerDiscoveryClient() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  Stop();
}

bool PeerDiscoveryClient::Start(StartCallback done) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (phase_ != Phase::kIdle) {
    RTC_LOG(LS_WARNING) << "Discovery already started";
    return false;
  }
  std::string error;
  if (!ValidateSwarmOptions(options_, &error)) {
    RTC_LOG(LS_ERROR) << "Invalid options: " << error;
    return false;
  }

  start_callback_ = std::move(done);
  phase_ = Phase::kConnecting;
  RTC_LOG(LS_INFO) << "Joining " << options_.info_hash << " as "
                   << options_.peer_id << " via " << options_.relay_urls.size()
                   << " relays";

  for (const auto& url : options_.relay_urls) {
    ConnectRelay(url);
  }

  if (connecting_.empty()) {
    // Report asynchronously, like every other startup outcome.
    task_queue_->PostTask(webrtc::SafeTask(safety_.flag(), [this]() {
      if (phase_ == Phase::kConnecting && connecting_.empty() &&
          trackers_.empty()) {
        FailStartup("No usable relay url");
      }
    }));
  }
  return true;
}

void PeerDiscoveryClient::Stop() {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  if (phase_ == Phase::kStopped) {
    return;
  }
  if (phase_ != Phase::kIdle) {
    RTC_LOG(LS_INFO) << "Stopping discovery for " << options_.info_hash;
  }
  phase_ = Phase::kStopped;
  start_callback_ = nullptr;

  // Detach everything first so that closing it produces no events.
  auto trackers = std::move(trackers_);
  trackers_.clear();
  auto connecting = std::move(connecting_);
  connecting_.clear();
  auto offers = std::move(pending_offers_);
  pending_offers_.clear();
  auto negotiating = std::move(negotiating_);
  negotiating_.clear();

  for (auto& entry : trackers) {
    entry.second->StopAnnouncing();
  }
  for (auto& entry : connecting) {
    entry.second->Close();
  }
  for (auto& entry : offers) {
    entry.second.session->Close();
  }
  for (auto& entry : negotiating) {
    entry.second.session->Close();
  }
}

int PeerDiscoveryClient::AddHandler(DiscoveryEventType type, Handler handler) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  return events_.AddHandler(type, std::move(handler));
}

void PeerDiscoveryClient::RemoveHandler(int id) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  events_.RemoveHandler(id);
}

size_t PeerDiscoveryClient::connected_peer_count() const {
  return std::count_if(connected_peers_.begin(), connected_peers_.end(),
                       [](const auto& entry) { return !entry.second.expired(); });
}

bool PeerDiscoveryClient::IsConnectedTo(const std::string& peer_id) const {
  auto it = connected_peers_.find(peer_id);
  if (it == connected_peers_.end()) {
    return false;
  }
  std::shared_ptr<PeerSession> session = it->second.lock();
  return session && !session->IsTerminal();
}

const TrackerConnection* PeerDiscoveryClient::tracker(const std::string& url) const {
  auto it = trackers_.find(url);
  return it == trackers_.end() ? nullptr : it->second.get();
}

// RELAYS

void PeerDiscoveryClient::ConnectRelay(const std::string& url) {
  if (connecting_.count(url) || trackers_.count(url)) {
    return;
  }
  std::unique_ptr<RelayChannel> channel = relay_factory_->Create(url);
  if (!channel) {
    RTC_LOG(LS_WARNING) << "Skipping relay " << url;
    return;
  }
  RelayChannel* raw = channel.get();
  connecting_[url] = std::move(channel);

  auto flag = safety_.flag();
  raw->Connect(webrtc::TimeDelta::Millis(options_.relay_connect_timeout_ms),
               [this, flag, url](bool ok, const std::string& error) {
                 if (!flag->alive()) {
                   return;
                 }
                 OnRelayConnectResult(url, ok, error);
               });
}

void PeerDiscoveryClient::OnRelayConnectResult(const std::string& url,
                                               bool ok,
                                               const std::string& error) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  auto it = connecting_.find(url);
  if (it == connecting_.end()) {
    return;
  }
  std::unique_ptr<RelayChannel> channel = std::move(it->second);
  connecting_.erase(it);

  if (!ok) {
    RTC_LOG(LS_WARNING) << "Relay " << url << " unreachable: " << error;
    DiscoveryEvent event;
    event.relay_url = url;
    event.reason = error;
    event.error = SwarmError::Make(SwarmErrorType::kRelayUnreachable, error);
    Emit(DiscoveryEventType::kError, event);
    if (trackers_.empty() && connecting_.empty()) {
      OnAllRelaysGone("No relay reachable");
    }
    return;
  }

  if (phase_ == Phase::kClosed || phase_ == Phase::kStopped) {
    channel->Close();
    return;
  }

  RTC_LOG(LS_INFO) << "Connected to relay " << url;
  auto tracker = std::make_unique<TrackerConnection>(
      std::move(channel), options_.announce_interval_ms,
      options_.max_announce_interval_ms, options_.backoff_multiplier);
  TrackerConnection* raw = tracker.get();
  raw->channel()->SetMessageCallback(
      [this, url](const std::string& text) { OnRelayMessage(url, text); });
  raw->channel()->SetCloseCallback(
      [this, url](const std::string& reason) { OnRelayClosed(url, reason); });
  trackers_[url] = std::move(tracker);

  switch (phase_) {
    case Phase::kConnecting:
      phase_ = Phase::kPreparing;
      PrepareFirstOffer();
      break;
    case Phase::kPreparing:
      // Picked up by FinishStartup.
      break;
    case Phase::kRunning:
      AnnounceWithOffer({url});
      StartTracker(raw);
      break;
    default:
      break;
  }
}

void PeerDiscoveryClient::OnRelayMessage(const std::string& url,
                                         const std::string& text) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  Json::Value message;
  std::string error;
  if (!ParseRelayMessage(text, &message, &error)) {
    RTC_LOG(LS_WARNING) << "Dropping message from " << url << " ("
                        << SwarmErrorTypeToString(SwarmErrorType::kMalformedMessage)
                        << "): " << error;
    return;
  }

  if (message.isMember(Tracker::kInfoHash) && message[Tracker::kInfoHash].isString() &&
      message[Tracker::kInfoHash].asString() != options_.info_hash) {
    RTC_LOG(LS_VERBOSE) << "Ignoring message for another info_hash from " << url;
    return;
  }

  RelayMessageKind kind = ClassifyRelayMessage(message);
  RTC_LOG(LS_VERBOSE) << "Relay " << url << " sent " << RelayMessageKindToString(kind);
  switch (kind) {
    case RelayMessageKind::kOffer:
      OnIncomingOffer(url, message);
      break;
    case RelayMessageKind::kAnswer:
      OnIncomingAnswer(url, message);
      break;
    case RelayMessageKind::kFailure: {
      const Json::Value& reason = message[Tracker::kFailureReason];
      DiscoveryEvent event;
      event.relay_url = url;
      event.reason = reason.isString() ? reason.asString() : WriteRelayMessage(reason);
      RTC_LOG(LS_WARNING) << "Relay " << url << " reported failure: " << event.reason;
      Emit(DiscoveryEventType::kRelayFailure, event);
      break;
    }
    case RelayMessageKind::kStats: {
      DiscoveryEvent event;
      event.relay_url = url;
      event.complete = readCount(message, Tracker::kComplete);
      event.incomplete = readCount(message, Tracker::kIncomplete);
      discovered_count_ = event.complete + event.incomplete;
      Emit(DiscoveryEventType::kStatsUpdate, event);
      break;
    }
    case RelayMessageKind::kScrape: {
      DiscoveryEvent event;
      event.relay_url = url;
      event.scrape = message;
      Emit(DiscoveryEventType::kScrape, event);
      break;
    }
    case RelayMessageKind::kUnknown:
      RTC_LOG(LS_INFO) << "Unrecognized message from " << url << ": "
                       << text.substr(0, 200);
      break;
  }
}

void PeerDiscoveryClient::OnRelayClosed(const std::string& url,
                                        const std::string& reason) {
  RTC_DCHECK_RUN_ON(&sequence_checker_);
  auto it = trackers_.find(url);
  if (it == trackers_.end()) {
    return;
  }
  std::unique_ptr<TrackerConnection> tracker = std::move(it->second);
  trackers_.erase(it);
  tracker->StopAnnouncing();
  // We are inside the channel's own callback; release it afterwards.
  task_queue_->PostTask([tracker = std::move(tracker)]() {});

  RTC_LOG(LS_WARNING) << "Relay " << url << " disconnected: " << reason;
  DiscoveryEvent event;
  event.relay_url = url;
  event.reason = reason;
  event.error = SwarmError::Make(SwarmErrorType::kRelayDisconnected, reason);
  Emit(DiscoveryEventType::kError, event);

  if (trackers_.empty() && connecting_.empty()) {
    OnAllRelaysGone("All relays disconnected");
  }
}

void PeerDiscoveryClient::OnAllRelaysGone(const std::string& reason) {
  switch (phase_) {
    case Phase::kConnecting:
    case Phase::kPreparing:
      FailStartup(reason);
      break;
    case Phase::kRunning: {
      RTC_LOG(LS_WARNING) << reason << ", discovery stopped";
      phase_ = Phase::kClosed;
      CloseAllPendingOffers();
      DiscoveryEvent event;
      event.reason = reason;
      Emit(DiscoveryEventType::kClosed, event);
      break;
    }
    default:
      break;
  }
}

void PeerDiscoveryClient::StartTracker(TrackerConnection* tracker) {
  tracker->StartAnnouncing(task_queue_, [this](TrackerConnection* tracker) {
    AnnounceWithOffer({tracker->url()});
  });
}

std::vector<std::string> PeerDiscoveryClient::TrackerUrls() const {
  std::vector<std::string> urls;
  for (const auto& entry : trackers_) {
    urls.push_back(entry.first);
  }
  return urls;
}

// STARTUP

void PeerDiscoveryClient::PrepareFirstOffer() {
  RTC_LOG(LS_INFO) << "Preparing first offer";
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(safety_.flag(),
                       [this]() {
                         if (phase_ != Phase::kPreparing) {
                           return;
                         }
                         RTC_LOG(LS_WARNING)
                             << "First offer not ready after "
                             << options_.startup_timeout_ms
                             << " ms, announcing without it";
                         FinishStartup(std::string());
                       }),
      webrtc::TimeDelta::Millis(options_.startup_timeout_ms));

  std::string offer_id = GenerateOffer([this](const std::string& offer_id) {
    if (phase_ == Phase::kPreparing) {
      FinishStartup(offer_id);
    } else if (phase_ == Phase::kRunning && !offer_id.empty()) {
      // Ready after the startup timeout; announce it late.
      SendAnnounce(TrackerUrls(), offer_id);
    }
  });
  if (offer_id.empty()) {
    FinishStartup(std::string());
  }
}

void PeerDiscoveryClient::FinishStartup(const std::string& first_offer_id) {
  phase_ = Phase::kRunning;
  std::vector<std::string> urls = TrackerUrls();
  if (!first_offer_id.empty() && pending_offers_.count(first_offer_id)) {
    SendAnnounce(urls, first_offer_id);
  } else {
    AnnounceWithOffer(urls);
  }
  for (auto& entry : trackers_) {
    StartTracker(entry.second.get());
  }
  RTC_LOG(LS_INFO) << "Discovery running on " << trackers_.size() << " relays";

  StartCallback done = std::move(start_callback_);
  start_callback_ = nullptr;
  if (done) {
    done(SwarmError::None());
  }
  if (phase_ == Phase::kRunning) {
    Emit(DiscoveryEventType::kReady, DiscoveryEvent());
  }
}

void PeerDiscoveryClient::FailStartup(const std::string& reason) {
  RTC_LOG(LS_ERROR) << "Discovery failed to start: " << reason;
  phase_ = Phase::kClosed;
  CloseAllPendingOffers();
  StartCallback done = std::move(start_callback_);
  start_callback_ = nullptr;
  if (done) {
    done(SwarmError::Make(SwarmErrorType::kRelayUnreachable, reason));
  }
}

// OFFERS

std::string PeerDiscoveryClient::GenerateOffer(
    std::function<void(const std::string&)> on_ready) {
  std::string offer_id = create_offer_id_();
  if (offer_id.empty()) {
    RTC_LOG(LS_ERROR) << "Failed to create offer id";
    return std::string();
  }
  std::unique_ptr<PeerTransport> transport = transport_factory_->Create(true);
  if (!transport) {
    RTC_LOG(LS_ERROR) << "Failed to create transport for offer";
    return std::string();
  }
  std::shared_ptr<PeerSession> session =
      PeerSession::Create(std::move(transport), SessionConfig(true));
  if (!session) {
    return std::string();
  }

  session->set_offer_id(offer_id);

  PendingOffer& offer = pending_offers_[offer_id];
  offer.offer_id = offer_id;
  offer.session = session;
  offer.created_ms = rtc::TimeMillis();
  offer.on_ready = std::move(on_ready);

  AttachSession(session);
  session->Start();
  return offer_id;
}

void PeerDiscoveryClient::AnnounceWithOffer(const std::vector<std::string>& urls) {
  if (static_cast<int>(pending_offers_.size()) >= options_.max_outstanding_offers) {
    RTC_LOG(LS_VERBOSE) << pending_offers_.size()
                        << " offers outstanding, announcing without a new one";
    SendAnnounce(urls, std::string());
    return;
  }
  std::string offer_id = GenerateOffer(
      [this, urls](const std::string& offer_id) { SendAnnounce(urls, offer_id); });
  if (offer_id.empty()) {
    SendAnnounce(urls, std::string());
  }
}

void PeerDiscoveryClient::SendAnnounce(const std::vector<std::string>& urls,
                                       const std::string& offer_id) {
  std::vector<OfferEntry> offers;
  if (!offer_id.empty()) {
    auto it = pending_offers_.find(offer_id);
    if (it != pending_offers_.end() && it->second.ready) {
      offers.push_back(OfferEntry{offer_id, it->second.sdp});
    }
  }

  Json::Value message =
      BuildAnnounce(options_.info_hash, options_.peer_id, options_.numwant, offers);
  int sent = 0;
  double interval_ms = 0;
  for (const auto& url : urls) {
    auto it = trackers_.find(url);
    if (it == trackers_.end()) {
      continue;
    }
    if (it->second->Send(message)) {
      ++sent;
      interval_ms = std::max(interval_ms, it->second->current_interval_ms());
    }
  }

  if (offers.empty()) {
    return;
  }
  if (sent == 0) {
    RTC_LOG(LS_WARNING) << "Offer " << offer_id << " reached no relay, dropping it";
    DropOffer(offer_id);
    return;
  }
  RTC_LOG(LS_INFO) << "Announced offer " << offer_id << " on " << sent << " relays";
  ArmOfferExpiry(offer_id, options_.offer_timeout_ms > 0
                               ? static_cast<double>(options_.offer_timeout_ms)
                               : 2 * interval_ms);
}

void PeerDiscoveryClient::ArmOfferExpiry(const std::string& offer_id,
                                         double timeout_ms) {
  auto it = pending_offers_.find(offer_id);
  if (it == pending_offers_.end()) {
    return;
  }
  it->second.expiry = std::make_unique<webrtc::ScopedTaskSafety>();
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(it->second.expiry->flag(),
                       [this, offer_id]() {
                         RTC_LOG(LS_INFO) << "Offer " << offer_id
                                          << " expired unanswered";
                         DropOffer(offer_id);
                       }),
      webrtc::TimeDelta::Millis(std::llround(timeout_ms)));
}

void PeerDiscoveryClient::DropOffer(const std::string& offer_id) {
  auto it = pending_offers_.find(offer_id);
  if (it == pending_offers_.end()) {
    return;
  }
  std::shared_ptr<PeerSession> session = std::move(it->second.session);
  pending_offers_.erase(it);
  session->Close();
}

void PeerDiscoveryClient::CloseAllPendingOffers() {
  auto offers = std::move(pending_offers_);
  pending_offers_.clear();
  for (auto& entry : offers) {
    entry.second.session->Close();
  }
}

// RELAYED SIGNALING

void PeerDiscoveryClient::OnIncomingOffer(const std::string& url,
                                          const Json::Value& message) {
  const std::string remote = message[Tracker::kPeerId].asString();
  SignalMessage signal;
  if (!message[Tracker::kOfferId].isString() ||
      !SignalMessageFromJson(message[Tracker::kOffer], &signal) ||
      signal.type != SignalMessage::Type::kOffer) {
    RTC_LOG(LS_WARNING) << "Dropping malformed offer from " << remote << " via " << url;
    return;
  }
  const std::string offer_id = message[Tracker::kOfferId].asString();

  if (remote == options_.peer_id) {
    RTC_LOG(LS_VERBOSE) << "Ignoring our own offer";
    return;
  }
  if (IsConnectedTo(remote)) {
    RTC_LOG(LS_VERBOSE) << "Already connected to " << remote << ", ignoring offer";
    return;
  }
  if (FindNegotiation(remote, false)) {
    RTC_LOG(LS_VERBOSE) << "Already answering " << remote << ", ignoring offer";
    return;
  }
  if (phase_ != Phase::kRunning && phase_ != Phase::kPreparing) {
    return;
  }
  // Both sides offered at once: one of the two handshakes is dropped on
  // both ends.
  std::shared_ptr<PeerSession> crossed = FindNegotiation(remote, true);
  if (crossed && IsPreferredRole(true, remote)) {
    RTC_LOG(LS_INFO) << "Offers with " << remote << " crossed, keeping ours";
    return;
  }

  std::unique_ptr<PeerTransport> transport = transport_factory_->Create(false);
  if (!transport) {
    RTC_LOG(LS_ERROR) << "Failed to create transport to answer " << remote;
    return;
  }
  std::shared_ptr<PeerSession> session =
      PeerSession::Create(std::move(transport), SessionConfig(false));
  if (!session) {
    return;
  }
  session->set_remote_peer_id(remote);
  session->set_offer_id(offer_id);

  if (crossed) {
    RTC_LOG(LS_INFO) << "Offers with " << remote << " crossed, answering theirs";
    DiscardNegotiation(crossed.get());
  }

  RTC_LOG(LS_INFO) << "Answering offer " << offer_id << " from " << remote;
  negotiating_[session.get()] = Negotiation{session, url};
  AttachSession(session);
  session->Signal(signal);
}

void PeerDiscoveryClient::OnIncomingAnswer(const std::string& url,
                                           const Json::Value& message) {
  const std::string remote = message[Tracker::kPeerId].asString();
  SignalMessage signal;
  if (!message[Tracker::kOfferId].isString() ||
      !SignalMessageFromJson(message[Tracker::kAnswer], &signal) ||
      signal.type != SignalMessage::Type::kAnswer) {
    RTC_LOG(LS_WARNING) << "Dropping malformed answer from " << remote << " via " << url;
    return;
  }
  if (message[Tracker::kToPeerId].isString() &&
      message[Tracker::kToPeerId].asString() != options_.peer_id) {
    RTC_LOG(LS_VERBOSE) << "Answer addressed to another peer, ignoring";
    return;
  }
  const std::string offer_id = message[Tracker::kOfferId].asString();

  auto it = pending_offers_.find(offer_id);
  if (it == pending_offers_.end()) {
    RTC_LOG(LS_INFO) << "Ignoring answer from " << remote << " for unknown offer "
                     << offer_id << " ("
                     << SwarmErrorTypeToString(SwarmErrorType::kStaleResponse) << ")";
    return;
  }
  if (remote == options_.peer_id) {
    RTC_LOG(LS_VERBOSE) << "Ignoring answer from ourselves";
    return;
  }

  // Leaving the pool cancels the expiry timer.
  std::shared_ptr<PeerSession> session = it->second.session;
  pending_offers_.erase(it);

  if (IsConnectedTo(remote)) {
    RTC_LOG(LS_INFO) << "Already connected to " << remote << ", dropping offer "
                     << offer_id;
    session->Close();
    return;
  }
  if (std::shared_ptr<PeerSession> answering = FindNegotiation(remote, false)) {
    if (!IsPreferredRole(true, remote)) {
      RTC_LOG(LS_INFO) << "Offers with " << remote << " crossed, keeping theirs";
      session->Close();
      return;
    }
    RTC_LOG(LS_INFO) << "Offers with " << remote << " crossed, keeping ours";
    DiscardNegotiation(answering.get());
  }

  RTC_LOG(LS_INFO) << "Offer " << offer_id << " answered by " << remote;
  session->set_remote_peer_id(remote);
  negotiating_[session.get()] = Negotiation{session, url};
  session->Signal(signal);
}

// SESSIONS

PeerSession::Config PeerDiscoveryClient::SessionConfig(bool initiator) const {
  PeerSession::Config config;
  config.initiator = initiator;
  config.ice_gathering_timeout =
      webrtc::TimeDelta::Millis(options_.ice_gathering_timeout_ms);
  config.negotiation_timeout =
      webrtc::TimeDelta::Millis(options_.negotiation_timeout_ms);
  config.max_pending_candidates = static_cast<size_t>(options_.max_pending_candidates);
  config.local_peer_id = options_.peer_id;
  return config;
}

void PeerDiscoveryClient::AttachSession(const std::shared_ptr<PeerSession>& session) {
  PeerSession* raw = session.get();
  auto flag = safety_.flag();
  session->AddHandler(SessionEventType::kSignal,
                      [this, raw, flag](const SessionEvent& event) {
                        if (flag->alive()) {
                          OnSessionSignal(raw, event.signal);
                        }
                      });
  session->AddHandler(SessionEventType::kConnect,
                      [this, raw, flag](const SessionEvent&) {
                        if (flag->alive()) {
                          OnSessionConnected(raw);
                        }
                      });
  session->AddHandler(SessionEventType::kError,
                      [this, raw, flag](const SessionEvent& event) {
                        if (flag->alive()) {
                          OnSessionEnded(raw, &event.error);
                        }
                      });
  session->AddHandler(SessionEventType::kClose,
                      [this, raw, flag](const SessionEvent&) {
                        if (flag->alive()) {
                          OnSessionEnded(raw, nullptr);
                        }
                      });
}

void PeerDiscoveryClient::OnSessionSignal(PeerSession* session,
                                          const SignalMessage& signal) {
  if (signal.type == SignalMessage::Type::kCandidate) {
    // Relays carry complete descriptions only.
    RTC_LOG(LS_VERBOSE) << "Dropping trickled candidate";
    return;
  }

  if (session->initiator()) {
    auto it = std::find_if(pending_offers_.begin(), pending_offers_.end(),
                           [session](const auto& entry) {
                             return entry.second.session.get() == session;
                           });
    if (it == pending_offers_.end() || signal.type != SignalMessage::Type::kOffer) {
      return;
    }
    it->second.ready = true;
    it->second.sdp = signal.sdp;
    const std::string offer_id = it->first;
    auto on_ready = std::move(it->second.on_ready);
    it->second.on_ready = nullptr;
    RTC_LOG(LS_INFO) << "Offer " << offer_id << " ready after "
                     << rtc::TimeMillis() - it->second.created_ms << " ms";
    if (on_ready) {
      on_ready(offer_id);
    }
    return;
  }

  auto it = negotiating_.find(session);
  if (it == negotiating_.end() || signal.type != SignalMessage::Type::kAnswer) {
    return;
  }
  auto tracker = trackers_.find(it->second.relay_url);
  if (tracker == trackers_.end()) {
    RTC_LOG(LS_WARNING) << "Relay " << it->second.relay_url
                        << " is gone, cannot answer " << session->remote_peer_id();
    return;
  }
  tracker->second->Send(BuildAnswer(options_.info_hash, options_.peer_id,
                                    session->remote_peer_id(), session->offer_id(),
                                    signal.sdp));
}

void PeerDiscoveryClient::OnSessionConnected(PeerSession* session) {
  auto it = negotiating_.find(session);
  if (it == negotiating_.end()) {
    RTC_LOG(LS_WARNING) << "Connect from a session that is not negotiating";
    return;
  }
  std::shared_ptr<PeerSession> connected = std::move(it->second.session);
  negotiating_.erase(it);

  const std::string remote = connected->remote_peer_id();
  auto current = connected_peers_.find(remote);
  std::shared_ptr<PeerSession> previous =
      current == connected_peers_.end() ? nullptr : current->second.lock();
  if (previous) {
    if (!IsPreferredRole(connected->initiator(), remote) ||
        IsPreferredRole(previous->initiator(), remote)) {
      RTC_LOG(LS_INFO) << "Second session with " << remote << " connected, closing it";
      connected->Close();
      return;
    }
    // The remote end keeps this one too, so the older session is already lost.
    RTC_LOG(LS_INFO) << "Session with " << remote << " superseded";
    previous->Close();
  }

  connected_peers_[remote] = connected;
  RTC_LOG(LS_INFO) << "Peer " << remote << " connected";
  DiscoveryEvent event;
  event.peer_id = remote;
  event.session = connected;
  Emit(DiscoveryEventType::kPeerConnected, event);
}

void PeerDiscoveryClient::OnSessionEnded(PeerSession* session,
                                         const SwarmError* error) {
  const std::string remote = session->remote_peer_id();
  bool tracked = false;
  std::function<void(const std::string&)> on_ready;
  std::shared_ptr<PeerSession> hold;

  auto offer = std::find_if(pending_offers_.begin(), pending_offers_.end(),
                            [session](const auto& entry) {
                              return entry.second.session.get() == session;
                            });
  if (offer != pending_offers_.end()) {
    hold = offer->second.session;
    on_ready = std::move(offer->second.on_ready);
    pending_offers_.erase(offer);
    tracked = true;
  }

  auto negotiation = negotiating_.find(session);
  if (negotiation != negotiating_.end()) {
    hold = negotiation->second.session;
    negotiating_.erase(negotiation);
    tracked = true;
  }

  auto connected = connected_peers_.find(remote);
  if (connected != connected_peers_.end() &&
      connected->second.lock().get() == session) {
    connected_peers_.erase(connected);
    tracked = true;
  }

  if (on_ready) {
    on_ready(std::string());
  }
  if (!tracked || remote.empty()) {
    return;
  }

  DiscoveryEvent event;
  event.peer_id = remote;
  if (error) {
    event.error = *error;
    RTC_LOG(LS_INFO) << "Session with " << remote << " failed: " << error->message;
    Emit(DiscoveryEventType::kPeerFailed, event);
  } else {
    RTC_LOG(LS_INFO) << "Session with " << remote << " closed";
    Emit(DiscoveryEventType::kPeerDisconnected, event);
  }
}

std::shared_ptr<PeerSession> PeerDiscoveryClient::FindNegotiation(
    const std::string& peer_id,
    bool initiator) const {
  for (const auto& entry : negotiating_) {
    const std::shared_ptr<PeerSession>& session = entry.second.session;
    if (session->initiator() == initiator && session->remote_peer_id() == peer_id) {
      return session;
    }
  }
  return nullptr;
}

// Of two sessions with the same peer, the one offered by the smaller peer id
// is kept. Both ends evaluate this the same way.
bool PeerDiscoveryClient::IsPreferredRole(bool initiator,
                                          const std::string& peer_id) const {
  return initiator == (options_.peer_id < peer_id);
}

void PeerDiscoveryClient::DiscardNegotiation(PeerSession* session) {
  auto it = negotiating_.find(session);
  if (it == negotiating_.end()) {
    return;
  }
  // Out of every pool first, so closing reports nothing.
  std::shared_ptr<PeerSession> hold = std::move(it->second.session);
  negotiating_.erase(it);
  hold->Close();
}

void PeerDiscoveryClient::Emit(DiscoveryEventType type, const DiscoveryEvent& event) {
  RTC_LOG(LS_VERBOSE) << "Discovery event " << DiscoveryEventTypeToString(type);
  events_.Emit(type, event);
}
