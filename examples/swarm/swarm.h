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

#ifndef WEBRTC_SWARM_SWARM_H_
#define WEBRTC_SWARM_SWARM_H_

#include <functional>
#include <string>

#include <rtc_base/logging.h>

#ifndef SWARM_EXPORT_H
#define SWARM_EXPORT_H

#if defined(_MSC_VER)
    #define SWARM_EXPORT __declspec(dllexport)
    #define SWARM_IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
    #define SWARM_EXPORT __attribute__((visibility("default")))
    #define SWARM_IMPORT __attribute__((visibility("default")))
#else
    #define SWARM_EXPORT
    #define SWARM_IMPORT
#endif

#ifdef SWARM_BUILDING_DLL
    #define SWARM_API SWARM_EXPORT
#else
    #define SWARM_API SWARM_IMPORT
#endif

#define AS_VERBOSE LS_VERBOSE
#define AS_INFO LS_INFO
#define AS_WARNING LS_WARNING
#define AS_ERROR LS_ERROR
#define APP_LOG(x) RTC_LOG(x)

#endif  // SWARM_EXPORT_H

// Failure classes surfaced by the discovery layer. None of them is fatal to
// the process; only kRelayUnreachable at startup fails PeerDiscoveryClient::Start.
enum class SwarmErrorType {
  kNone,
  kRelayUnreachable,
  kRelayDisconnected,
  kMalformedMessage,
  kNegotiationTimeout,
  kNegotiationFailure,
  kStaleResponse,
};

struct SwarmError {
  SwarmErrorType type = SwarmErrorType::kNone;
  std::string message;

  bool ok() const { return type == SwarmErrorType::kNone; }

  static SwarmError None() { return SwarmError(); }
  static SwarmError Make(SwarmErrorType type, const std::string& message) {
    SwarmError error;
    error.type = type;
    error.message = message;
    return error;
  }
};

SWARM_API const char* SwarmErrorTypeToString(SwarmErrorType type);

struct IceCandidate {
  std::string sdp_mid;
  int sdp_mline_index = 0;
  std::string candidate;
};

// Payload a PeerSession hands to the signaling path, and accepts back from it.
struct SignalMessage {
  enum class Type { kOffer, kAnswer, kCandidate };

  Type type = Type::kOffer;
  std::string sdp;
  IceCandidate candidate;

  static SignalMessage Offer(const std::string& sdp);
  static SignalMessage Answer(const std::string& sdp);
  static SignalMessage Candidate(const IceCandidate& candidate);
};

SWARM_API const char* SignalTypeToString(SignalMessage::Type type);

// LOGGING

struct LogRecord {
  rtc::LoggingSeverity severity = rtc::LS_INFO;
  std::string message;
};

// Forwards every log line it receives to a callback as a LogRecord. Install
// it with SwarmAddLogSink; the callback runs on whatever thread logged.
class SWARM_API StructuredLogSink : public rtc::LogSink {
 public:
  explicit StructuredLogSink(std::function<void(const LogRecord&)> callback);
  ~StructuredLogSink() override;

  using rtc::LogSink::OnLogMessage;
  void OnLogMessage(const std::string& message,
                    rtc::LoggingSeverity severity) override;
  void OnLogMessage(const std::string& message) override;

 private:
  std::function<void(const LogRecord&)> callback_;
};

SWARM_API void SwarmSetLoggingLevel(rtc::LoggingSeverity level);
SWARM_API void SwarmAddLogSink(rtc::LogSink* sink, rtc::LoggingSeverity min_severity);
SWARM_API void SwarmRemoveLogSink(rtc::LogSink* sink);

// One-line JSON rendering of a record: {"severity":"warning","message":"..."}
SWARM_API std::string SwarmFormatLogRecord(const LogRecord& record);

#endif  // WEBRTC_SWARM_SWARM_H_
