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

#include "swarm.h"

#include <json/json.h>

#include <utility>

const char* SwarmErrorTypeToString(SwarmErrorType type) {
  switch (type) {
    case SwarmErrorType::kNone:
      return "none";
    case SwarmErrorType::kRelayUnreachable:
      return "relay-unreachable";
    case SwarmErrorType::kRelayDisconnected:
      return "relay-disconnected";
    case SwarmErrorType::kMalformedMessage:
      return "malformed-message";
    case SwarmErrorType::kNegotiationTimeout:
      return "negotiation-timeout";
    case SwarmErrorType::kNegotiationFailure:
      return "negotiation-failure";
    case SwarmErrorType::kStaleResponse:
      return "stale-response";
  }
  return "unknown";
}

SignalMessage SignalMessage::Offer(const std::string& sdp) {
  SignalMessage message;
  message.type = Type::kOffer;
  message.sdp = sdp;
  return message;
}

SignalMessage SignalMessage::Answer(const std::string& sdp) {
  SignalMessage message;
  message.type = Type::kAnswer;
  message.sdp = sdp;
  return message;
}

SignalMessage SignalMessage::Candidate(const IceCandidate& candidate) {
  SignalMessage message;
  message.type = Type::kCandidate;
  message.candidate = candidate;
  return message;
}

const char* SignalTypeToString(SignalMessage::Type type) {
  switch (type) {
    case SignalMessage::Type::kOffer:
      return "offer";
    case SignalMessage::Type::kAnswer:
      return "answer";
    case SignalMessage::Type::kCandidate:
      return "candidate";
  }
  return "unknown";
}

// LOGGING

StructuredLogSink::StructuredLogSink(std::function<void(const LogRecord&)> callback)
    : callback_(std::move(callback)) {}

StructuredLogSink::~StructuredLogSink() = default;

void StructuredLogSink::OnLogMessage(const std::string& message,
                                     rtc::LoggingSeverity severity) {
  if (!callback_) {
    return;
  }
  LogRecord record;
  record.severity = severity;
  record.message = message;
  // Log lines arrive newline-terminated.
  while (!record.message.empty() &&
         (record.message.back() == '\n' || record.message.back() == '\r')) {
    record.message.pop_back();
  }
  callback_(record);
}

void StructuredLogSink::OnLogMessage(const std::string& message) {
  OnLogMessage(message, rtc::LS_INFO);
}

void SwarmSetLoggingLevel(rtc::LoggingSeverity level) {
  rtc::LogMessage::LogToDebug(level);
}

void SwarmAddLogSink(rtc::LogSink* sink, rtc::LoggingSeverity min_severity) {
  if (sink) {
    rtc::LogMessage::AddLogToStream(sink, min_severity);
  }
}

void SwarmRemoveLogSink(rtc::LogSink* sink) {
  if (sink) {
    rtc::LogMessage::RemoveLogToStream(sink);
  }
}

std::string SwarmFormatLogRecord(const LogRecord& record) {
  const char* severity = "info";
  switch (record.severity) {
    case rtc::LS_VERBOSE:
      severity = "verbose";
      break;
    case rtc::LS_INFO:
      severity = "info";
      break;
    case rtc::LS_WARNING:
      severity = "warning";
      break;
    case rtc::LS_ERROR:
      severity = "error";
      break;
    default:
      severity = "none";
      break;
  }

  Json::Value line;
  line["severity"] = severity;
  line["message"] = record.message;

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, line);
}
