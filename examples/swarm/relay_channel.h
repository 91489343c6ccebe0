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

#ifndef EXAMPLES_SWARM_RELAY_CHANNEL_H_
#define EXAMPLES_SWARM_RELAY_CHANNEL_H_

#include <functional>
#include <memory>
#include <string>

#include <api/task_queue/pending_task_safety_flag.h>
#include <api/task_queue/task_queue_base.h>
#include <api/units/time_delta.h>
#include <rtc_base/thread.h>

#include "swarm.h"
#include "utils.h"

class WebSocketClient;

// One text-message connection to a relay. Callbacks are delivered on the
// thread that created the channel, never from inside the call that caused
// them.
class RelayChannel {
 public:
  using ConnectCallback = std::function<void(bool ok, const std::string& error)>;
  using MessageCallback = std::function<void(const std::string& text)>;
  using CloseCallback = std::function<void(const std::string& reason)>;

  virtual ~RelayChannel() = default;

  virtual const std::string& url() const = 0;

  // Invokes callback once: on success, on failure, or when timeout elapses
  // first.
  virtual void Connect(webrtc::TimeDelta timeout, ConnectCallback callback) = 0;
  virtual bool Send(const std::string& text) = 0;
  // Local close. Neither the close callback nor a pending connect callback
  // is invoked afterwards.
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  virtual void SetMessageCallback(MessageCallback callback) = 0;
  // Remote or I/O driven closure of an open channel.
  virtual void SetCloseCallback(CloseCallback callback) = 0;
};

class RelayChannelFactory {
 public:
  virtual ~RelayChannelFactory() = default;
  // nullptr if the url cannot be used.
  virtual std::unique_ptr<RelayChannel> Create(const std::string& url) = 0;
};

// RelayChannel over WebSocketClient. Socket I/O runs on a private thread;
// results are posted back to the owning thread.
class SWARM_API WebSocketRelayChannel : public RelayChannel {
 public:
  WebSocketRelayChannel(const std::string& url, const RelayUrl& parsed);
  ~WebSocketRelayChannel() override;

  const std::string& url() const override { return url_; }
  void Connect(webrtc::TimeDelta timeout, ConnectCallback callback) override;
  bool Send(const std::string& text) override;
  void Close() override;
  bool IsOpen() const override { return open_; }

  void SetMessageCallback(MessageCallback callback) override;
  void SetCloseCallback(CloseCallback callback) override;

 private:
  void FinishConnect(bool ok, const std::string& error);
  void OnRemoteClose(const std::string& reason);

  const std::string url_;
  const RelayUrl parsed_;
  webrtc::TaskQueueBase* const owner_;
  std::unique_ptr<rtc::Thread> io_thread_;
  std::unique_ptr<WebSocketClient> client_;

  bool open_ = false;
  bool closed_ = false;
  ConnectCallback connect_callback_;
  MessageCallback message_callback_;
  CloseCallback close_callback_;

  webrtc::ScopedTaskSafety safety_;
};

class SWARM_API WebSocketRelayChannelFactory : public RelayChannelFactory {
 public:
  std::unique_ptr<RelayChannel> Create(const std::string& url) override;
};

#endif  // EXAMPLES_SWARM_RELAY_CHANNEL_H_
