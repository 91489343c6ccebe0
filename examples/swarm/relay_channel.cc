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

#include "relay_channel.h"

#include <utility>

#include <rtc_base/checks.h>

#include "wsock.h"

WebSocketRelayChannel::WebSocketRelayChannel(const std::string& url,
                                             const RelayUrl& parsed)
    : url_(url),
      parsed_(parsed),
      owner_(webrtc::TaskQueueBase::Current()),
      io_thread_(rtc::Thread::CreateWithSocketServer()),
      client_(std::make_unique<WebSocketClient>()) {
  RTC_DCHECK(owner_);
  io_thread_->SetName("relay_io", nullptr);
  io_thread_->Start();
  client_->set_network_thread(io_thread_.get());
}

WebSocketRelayChannel::~WebSocketRelayChannel() {
  io_thread_->BlockingCall([this]() { client_->disconnect(); });
  io_thread_->Stop();
  client_.reset();
}

void WebSocketRelayChannel::Connect(webrtc::TimeDelta timeout,
                                    ConnectCallback callback) {
  if (open_ || closed_ || connect_callback_) {
    owner_->PostTask(webrtc::SafeTask(safety_.flag(), [callback]() {
      callback(false, "Connect already attempted");
    }));
    return;
  }
  connect_callback_ = std::move(callback);

  owner_->PostDelayedTask(
      webrtc::SafeTask(safety_.flag(),
                       [this, timeout]() {
                         FinishConnect(false, "Timed out after " +
                                                  std::to_string(timeout.ms()) +
                                                  " ms");
                       }),
      timeout);

  WebSocketClient::Config config;
  config.host = parsed_.host;
  config.port = parsed_.port;
  config.path = parsed_.path;
  config.use_ssl = parsed_.secure;
  config.timeout_ms = static_cast<int>(timeout.ms());

  auto flag = safety_.flag();
  webrtc::TaskQueueBase* owner = owner_;
  io_thread_->PostTask([this, flag, owner, config]() {
    bool ok = client_->connect(config);
    if (ok) {
      client_->set_message_callback([this, flag, owner](const std::string& text) {
        owner->PostTask(webrtc::SafeTask(flag, [this, text]() {
          if (!open_ || !message_callback_) {
            return;
          }
          auto callback = message_callback_;
          callback(text);
        }));
      });
      client_->set_close_callback([this, flag, owner](const std::string& reason) {
        owner->PostTask(webrtc::SafeTask(
            flag, [this, reason]() { OnRemoteClose(reason); }));
      });
    }
    owner->PostTask(webrtc::SafeTask(flag, [this, ok]() {
      FinishConnect(ok, ok ? std::string() : "Connection failed");
    }));
  });
}

void WebSocketRelayChannel::FinishConnect(bool ok, const std::string& error) {
  if (!connect_callback_) {
    // Success after the timeout already fired, or after Close().
    if (ok && !open_) {
      RTC_LOG(LS_INFO) << "Dropping late connection to " << url_;
      io_thread_->PostTask([this]() { client_->disconnect(); });
    }
    return;
  }

  ConnectCallback callback = std::move(connect_callback_);
  connect_callback_ = nullptr;
  if (ok) {
    open_ = true;
    io_thread_->PostTask([this]() { client_->start_listening(); });
  } else {
    closed_ = true;
    io_thread_->PostTask([this]() { client_->disconnect(); });
  }
  callback(ok, error);
}

bool WebSocketRelayChannel::Send(const std::string& text) {
  if (!open_) {
    RTC_LOG(LS_WARNING) << "Relay " << url_ << " is not open, dropping message";
    return false;
  }
  io_thread_->PostTask([this, text]() {
    if (!client_->send_message(text)) {
      RTC_LOG(LS_WARNING) << "Send to " << url_ << " failed";
    }
  });
  return true;
}

void WebSocketRelayChannel::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  open_ = false;
  connect_callback_ = nullptr;
  io_thread_->PostTask([this]() { client_->disconnect(); });
}

void WebSocketRelayChannel::SetMessageCallback(MessageCallback callback) {
  message_callback_ = std::move(callback);
}

void WebSocketRelayChannel::SetCloseCallback(CloseCallback callback) {
  close_callback_ = std::move(callback);
}

void WebSocketRelayChannel::OnRemoteClose(const std::string& reason) {
  if (!open_) {
    return;
  }
  open_ = false;
  closed_ = true;
  auto callback = close_callback_;
  if (callback) {
    callback(reason);
  }
}

std::unique_ptr<RelayChannel> WebSocketRelayChannelFactory::Create(
    const std::string& url) {
  RelayUrl parsed;
  if (!ParseRelayUrl(url, &parsed)) {
    RTC_LOG(LS_WARNING) << "Unusable relay url: " << url;
    return nullptr;
  }
  return std::make_unique<WebSocketRelayChannel>(url, parsed);
}
