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

#ifndef EXAMPLES_SWARM_STATUS_H_
#define EXAMPLES_SWARM_STATUS_H_

// -----------------------------------------------------------------------------
// WebTorrent tracker wire vocabulary (JSON text frames over WebSocket)
// -----------------------------------------------------------------------------
namespace Tracker {

// Actions
inline constexpr const char kAnnounce[] = "announce";
inline constexpr const char kScrape[]   = "scrape";

// Envelope fields
inline constexpr const char kAction[]        = "action";
inline constexpr const char kInfoHash[]      = "info_hash";
inline constexpr const char kPeerId[]        = "peer_id";
inline constexpr const char kToPeerId[]      = "to_peer_id";
inline constexpr const char kNumWant[]       = "numwant";
inline constexpr const char kOffers[]        = "offers";
inline constexpr const char kOfferId[]       = "offer_id";
inline constexpr const char kOffer[]         = "offer";
inline constexpr const char kAnswer[]        = "answer";
inline constexpr const char kFailureReason[] = "failure reason";

// Stats reply
inline constexpr const char kComplete[]   = "complete";
inline constexpr const char kIncomplete[] = "incomplete";
inline constexpr const char kInterval[]   = "interval";

}  // namespace Tracker

// -----------------------------------------------------------------------------
// Signaling payload fields, carried inside tracker envelopes
// -----------------------------------------------------------------------------
namespace Signal {

inline constexpr const char kType[]      = "type";
inline constexpr const char kSdp[]       = "sdp";
inline constexpr const char kCandidate[] = "candidate";
inline constexpr const char kSdpMid[]    = "sdpMid";
inline constexpr const char kSdpMLineIndex[] = "sdpMLineIndex";

inline constexpr const char kTypeOffer[]     = "offer";
inline constexpr const char kTypeAnswer[]    = "answer";
inline constexpr const char kTypeCandidate[] = "candidate";

}  // namespace Signal

#endif  // EXAMPLES_SWARM_STATUS_H_
