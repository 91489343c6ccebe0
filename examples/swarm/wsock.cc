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

#include "wsock.h"

#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

#include <api/units/time_delta.h>
#include <rtc_base/crypto_random.h>

namespace {

const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kReadPollMs = 20;
constexpr int kPingIntervalSeconds = 20;
constexpr int kWriteRetryMs = 5;

std::string randomBytes(size_t length) {
  std::string bytes;
  if (!rtc::CreateRandomData(length, &bytes)) {
    APP_LOG(AS_ERROR) << "WebSocketClient: random source failed";
    bytes.assign(length, '\0');
  }
  return bytes;
}

}  // namespace

WebSocketClient::WebSocketClient()
    : sockfd_(-1),
      ssl_ctx_(nullptr),
      ssl_(nullptr),
      use_ssl_(false),
      running_(false),
      connected_(false),
      network_thread_(nullptr),
      in_fragment_(false) {}

WebSocketClient::~WebSocketClient() {
  disconnect();
}

bool WebSocketClient::connect(const Config& config) {
  config_ = config;
  use_ssl_ = config.use_ssl;
  buffer_.clear();
  fragments_.clear();
  in_fragment_ = false;

  APP_LOG(AS_INFO) << "Connecting to WebSocket server at " << config.host << ":"
                   << config.port << config.path;

  if (!create_socket_connection()) {
    return false;
  }

  if (use_ssl_ && (!setup_ssl_context() || !perform_ssl_handshake())) {
    cleanup_connection();
    return false;
  }

  if (!send_http_handshake()) {
    cleanup_connection();
    return false;
  }

  // Reads are polled from the network thread from here on.
  int flags = fcntl(sockfd_, F_GETFL, 0);
  if (flags < 0 || fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    APP_LOG(AS_ERROR) << "Failed to make socket non-blocking: " << strerror(errno);
    cleanup_connection();
    return false;
  }

  connected_ = true;
  return true;
}

void WebSocketClient::disconnect() {
  running_ = false;
  message_callback_ = nullptr;
  close_callback_ = nullptr;

  if (connected_.exchange(false)) {
    // Best effort; the server may already be gone.
    if (!write_all(encode_frame(kClose, std::string(), true))) {
      APP_LOG(AS_VERBOSE) << "Close frame not delivered to " << config_.host;
    }
  }
  cleanup_connection();
}

bool WebSocketClient::is_connected() const {
  return sockfd_ != -1 && connected_.load();
}

bool WebSocketClient::send_message(const std::string& message) {
  if (!is_connected()) {
    APP_LOG(AS_WARNING) << "Cannot send, not connected to " << config_.host;
    return false;
  }
  APP_LOG(AS_VERBOSE) << "Sending WebSocket message: " << message.substr(0, 200)
                      << (message.length() > 200 ? "..." : "");
  if (!write_all(encode_frame(kText, message, true))) {
    return false;
  }
  return true;
}

void WebSocketClient::set_message_callback(
    std::function<void(const std::string&)> callback) {
  message_callback_ = std::move(callback);
}

void WebSocketClient::set_close_callback(
    std::function<void(const std::string& reason)> callback) {
  close_callback_ = std::move(callback);
}

void WebSocketClient::start_listening() {
  if (!network_thread_) {
    APP_LOG(AS_ERROR) << "WebSocketClient::start_listening: Network thread not set";
    return;
  }
  if (running_.exchange(true)) {
    APP_LOG(AS_WARNING) << "WebSocketClient::start_listening: Already running";
    return;
  }

  network_thread_->PostTask([this]() { async_read(); });
  schedule_ping();
}

void WebSocketClient::set_network_thread(rtc::Thread* thread) {
  network_thread_ = thread;
}

std::string WebSocketClient::generate_websocket_key() {
  return base64_encode(randomBytes(16));
}

std::string WebSocketClient::base64_encode(const std::string& in) {
  std::string out;
  int val = 0, valb = -6;
  for (unsigned char c : in) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(base64_chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (out.size() % 4) {
    out.push_back('=');
  }
  return out;
}

std::string WebSocketClient::encode_frame(uint8_t opcode,
                                          const std::string& payload,
                                          bool masked) {
  std::string frame;
  frame.push_back(static_cast<char>(0x80 | (opcode & 0x0F)));  // FIN + opcode

  const uint8_t mask_bit = masked ? 0x80 : 0x00;
  uint64_t length = payload.length();
  if (length <= 125) {
    frame.push_back(static_cast<char>(mask_bit | length));
  } else if (length <= 65535) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
  }

  if (!masked) {
    frame += payload;
    return frame;
  }

  std::string mask = randomBytes(4);
  frame += mask;
  for (size_t i = 0; i < payload.length(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
  }
  return frame;
}

bool WebSocketClient::decode_frames(std::string* buffer,
                                    std::vector<Frame>* frames) {
  const std::string& data = *buffer;
  size_t pos = 0;
  bool ok = true;

  while (data.size() - pos >= 2) {
    const size_t available = data.size() - pos;
    uint8_t first_byte = static_cast<uint8_t>(data[pos]);
    uint8_t second_byte = static_cast<uint8_t>(data[pos + 1]);
    uint8_t opcode = first_byte & 0x0F;

    if ((first_byte & 0x70) != 0 || (opcode > kBinary && opcode < kClose) ||
        opcode > kPong) {
      APP_LOG(AS_ERROR) << "Invalid frame header 0x" << std::hex
                        << static_cast<int>(first_byte) << std::dec;
      ok = false;
      break;
    }

    bool masked = (second_byte & 0x80) != 0;
    uint64_t length = second_byte & 0x7F;
    size_t header_size = 2;

    if (length == 126) {
      if (available < 4) {
        break;
      }
      length = (static_cast<uint64_t>(static_cast<uint8_t>(data[pos + 2])) << 8) |
               static_cast<uint64_t>(static_cast<uint8_t>(data[pos + 3]));
      header_size = 4;
    } else if (length == 127) {
      if (available < 10) {
        break;
      }
      length = 0;
      for (int i = 0; i < 8; ++i) {
        length = (length << 8) |
                 static_cast<uint64_t>(static_cast<uint8_t>(data[pos + 2 + i]));
      }
      header_size = 10;
    }

    if (length > kMaxMessageSize) {
      APP_LOG(AS_ERROR) << "Frame of " << length << " bytes exceeds limit";
      ok = false;
      break;
    }

    size_t mask_size = masked ? 4 : 0;
    uint64_t total_frame_size = header_size + mask_size + length;
    if (available < total_frame_size) {
      break;
    }

    Frame frame;
    frame.opcode = opcode;
    frame.fin = (first_byte & 0x80) != 0;
    frame.payload = data.substr(pos + header_size + mask_size, length);
    if (masked) {
      const char* mask_key = data.data() + pos + header_size;
      for (size_t i = 0; i < frame.payload.length(); ++i) {
        frame.payload[i] ^= mask_key[i % 4];
      }
    }
    frames->push_back(std::move(frame));
    pos += total_frame_size;
  }

  buffer->erase(0, pos);
  return ok;
}

bool WebSocketClient::create_socket_connection() {
  struct addrinfo hints, *res;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  int status = getaddrinfo(config_.host.c_str(), config_.port.c_str(), &hints, &res);
  if (status != 0) {
    APP_LOG(AS_ERROR) << "getaddrinfo failed for " << config_.host << ": "
                      << gai_strerror(status);
    return false;
  }

  struct timeval tv;
  tv.tv_sec = config_.timeout_ms / 1000;
  tv.tv_usec = (config_.timeout_ms % 1000) * 1000;

  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    sockfd_ = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sockfd_ < 0) {
      APP_LOG(AS_WARNING) << "Socket creation failed: " << strerror(errno);
      sockfd_ = -1;
      continue;
    }
    // Bounds connect() as well as the handshake reads and writes.
    setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    if (::connect(sockfd_, ai->ai_addr, ai->ai_addrlen) == 0) {
      APP_LOG(AS_INFO) << "TCP connection established to " << config_.host << ":"
                       << config_.port;
      freeaddrinfo(res);
      return true;
    }
    APP_LOG(AS_WARNING) << "Socket connect to " << config_.host
                        << " failed: " << strerror(errno);
    ::close(sockfd_);
    sockfd_ = -1;
  }

  freeaddrinfo(res);
  return false;
}

bool WebSocketClient::setup_ssl_context() {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (!ssl_ctx_) {
    log_ssl_error("Failed to create SSL context");
    return false;
  }

  SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);
  SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
    log_ssl_error("Failed to load default CA paths");
    return false;
  }
  SSL_CTX_set_mode(ssl_ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
  return true;
}

bool WebSocketClient::perform_ssl_handshake() {
  ssl_ = SSL_new(ssl_ctx_);
  if (!ssl_) {
    log_ssl_error("Failed to create SSL object");
    return false;
  }

  if (SSL_set_fd(ssl_, sockfd_) != 1) {
    log_ssl_error("Failed to set SSL file descriptor");
    return false;
  }

  // SNI plus hostname verification
  if (SSL_set_tlsext_host_name(ssl_, config_.host.c_str()) != 1) {
    log_ssl_error("Failed to set SNI hostname");
  }
  if (SSL_set1_host(ssl_, config_.host.c_str()) != 1) {
    log_ssl_error("Failed to set expected hostname");
    return false;
  }

  int connect_result = SSL_connect(ssl_);
  if (connect_result <= 0) {
    int ssl_err = SSL_get_error(ssl_, connect_result);
    APP_LOG(AS_ERROR) << "SSL connection to " << config_.host
                      << " failed with error " << ssl_err;
    log_ssl_error("SSL handshake failed");
    return false;
  }

  APP_LOG(AS_INFO) << "SSL connection established with " << SSL_get_cipher(ssl_)
                   << ", protocol: " << SSL_get_version(ssl_);
  return true;
}

bool WebSocketClient::send_http_handshake() {
  std::ostringstream request;
  request << "GET " << config_.path << " HTTP/1.1\r\n";
  request << "Host: " << config_.host << ":" << config_.port << "\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Pragma: no-cache\r\n";
  request << "Cache-Control: no-cache\r\n";
  request << "User-Agent: webrtc-swarm/1.0\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "Sec-WebSocket-Key: " << generate_websocket_key() << "\r\n";
  for (const auto& [key, value] : config_.headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "\r\n";

  if (!write_all(request.str())) {
    APP_LOG(AS_ERROR) << "Failed to send upgrade request to " << config_.host;
    return false;
  }

  // The socket is still blocking with SO_RCVTIMEO, so a stalled server ends
  // the loop with EAGAIN.
  char buffer[4096];
  std::string response;
  while (response.find("\r\n\r\n") == std::string::npos) {
    if (response.size() > 16 * 1024) {
      APP_LOG(AS_ERROR) << "Upgrade response too large";
      return false;
    }
    int bytes_read;
    if (use_ssl_) {
      bytes_read = SSL_read(ssl_, buffer, sizeof(buffer));
      if (bytes_read <= 0) {
        log_ssl_error("SSL_read failed in handshake");
        return false;
      }
    } else {
      bytes_read = recv(sockfd_, buffer, sizeof(buffer), 0);
      if (bytes_read < 0) {
        if (errno == EINTR) {
          continue;
        }
        APP_LOG(AS_ERROR) << "recv failed in handshake: " << strerror(errno);
        return false;
      }
      if (bytes_read == 0) {
        APP_LOG(AS_ERROR) << "Connection closed by server during handshake";
        return false;
      }
    }
    response.append(buffer, bytes_read);
  }

  size_t header_end = response.find("\r\n\r\n") + 4;
  std::string status_line = response.substr(0, response.find("\r\n"));
  if (status_line.find(" 101") == std::string::npos) {
    APP_LOG(AS_ERROR) << "WebSocket handshake rejected: " << status_line;
    return false;
  }

  // Frames may follow the headers in the same read.
  buffer_ = response.substr(header_end);
  APP_LOG(AS_INFO) << "WebSocket handshake with " << config_.host << " successful";
  return true;
}

bool WebSocketClient::write_all(const std::string& bytes) {
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  if (sockfd_ == -1 || (use_ssl_ && !ssl_)) {
    APP_LOG(AS_ERROR) << "Cannot write: socket is closed";
    return false;
  }

  size_t offset = 0;
  int waited_ms = 0;
  while (offset < bytes.size()) {
    int written;
    if (use_ssl_) {
      written = SSL_write(ssl_, bytes.data() + offset,
                          static_cast<int>(bytes.size() - offset));
      if (written <= 0) {
        int err = SSL_get_error(ssl_, written);
        if ((err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) &&
            waited_ms < config_.timeout_ms) {
          std::this_thread::sleep_for(std::chrono::milliseconds(kWriteRetryMs));
          waited_ms += kWriteRetryMs;
          continue;
        }
        log_ssl_error("SSL_write failed");
        return false;
      }
    } else {
      written = send(sockfd_, bytes.data() + offset, bytes.size() - offset,
                     MSG_NOSIGNAL);
      if (written < 0) {
        if ((errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) &&
            waited_ms < config_.timeout_ms) {
          std::this_thread::sleep_for(std::chrono::milliseconds(kWriteRetryMs));
          waited_ms += kWriteRetryMs;
          continue;
        }
        APP_LOG(AS_ERROR) << "send failed: " << strerror(errno)
                          << " (errno: " << errno << ")";
        return false;
      }
    }
    offset += written;
  }
  return true;
}

bool WebSocketClient::reassemble(Frame* frame,
                                 std::string* fragments,
                                 bool* in_fragment,
                                 std::vector<std::string>* messages) {
  if (frame->opcode == kContinuation) {
    if (!*in_fragment) {
      APP_LOG(AS_ERROR) << "Continuation frame without start, ignoring";
      return true;
    }
    if (fragments->size() + frame->payload.size() > kMaxMessageSize) {
      APP_LOG(AS_ERROR) << "Fragmented message exceeds " << kMaxMessageSize
                        << " bytes";
      return false;
    }
    *fragments += frame->payload;
    if (frame->fin) {
      messages->push_back(std::move(*fragments));
      fragments->clear();
      *in_fragment = false;
    }
    return true;
  }

  if (*in_fragment) {
    APP_LOG(AS_WARNING) << "New message before fragmented one finished, dropping "
                        << fragments->size() << " bytes";
    fragments->clear();
    *in_fragment = false;
  }
  if (frame->fin) {
    messages->push_back(std::move(frame->payload));
  } else {
    *fragments = std::move(frame->payload);
    *in_fragment = true;
  }
  return true;
}

std::vector<std::string> WebSocketClient::process_websocket_frames(bool* closed) {
  std::vector<std::string> messages;
  std::vector<Frame> frames;
  if (!decode_frames(&buffer_, &frames)) {
    buffer_.clear();
    *closed = true;
  }

  for (auto& frame : frames) {
    switch (frame.opcode) {
      case kText:
      case kBinary:
      case kContinuation:
        if (!reassemble(&frame, &fragments_, &in_fragment_, &messages)) {
          fragments_.clear();
          in_fragment_ = false;
          *closed = true;
          return messages;
        }
        break;
      case kPing:
        APP_LOG(AS_VERBOSE) << "Received ping frame, length: " << frame.payload.size();
        send_pong_frame(frame.payload);
        break;
      case kPong:
        APP_LOG(AS_VERBOSE) << "Received pong frame";
        break;
      case kClose:
        APP_LOG(AS_INFO) << "Received close frame from " << config_.host;
        *closed = true;
        break;
      default:
        APP_LOG(AS_WARNING) << "Skipping unhandled opcode: 0x" << std::hex
                            << static_cast<int>(frame.opcode) << std::dec;
        break;
    }
  }
  return messages;
}

void WebSocketClient::send_ping() {
  if (!write_all(encode_frame(kPing, std::string(), true))) {
    APP_LOG(AS_WARNING) << "Failed to send ping to " << config_.host;
    return;
  }
  APP_LOG(AS_VERBOSE) << "Sent ping frame";
}

void WebSocketClient::send_pong_frame(const std::string& ping_payload) {
  if (!write_all(encode_frame(kPong, ping_payload, true))) {
    APP_LOG(AS_WARNING) << "Failed to send pong to " << config_.host;
    return;
  }
  APP_LOG(AS_VERBOSE) << "Sent pong frame in response to ping";
}

void WebSocketClient::schedule_ping() {
  network_thread_->PostDelayedTask(
      [this]() {
        if (!running_.load() || !is_connected()) {
          return;
        }
        send_ping();
        schedule_ping();
      },
      webrtc::TimeDelta::Seconds(kPingIntervalSeconds));
}

void WebSocketClient::async_read() {
  if (!running_.load() || !is_connected()) {
    return;
  }

  char buffer[8192];
  bool got_data = false;
  for (;;) {
    int bytes_read;
    if (use_ssl_) {
      bytes_read = SSL_read(ssl_, buffer, sizeof(buffer));
      if (bytes_read <= 0) {
        int ssl_err = SSL_get_error(ssl_, bytes_read);
        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
          break;
        }
        if (ssl_err == SSL_ERROR_ZERO_RETURN) {
          handle_connection_lost("Connection closed by server");
          return;
        }
        log_ssl_error("SSL_read failed in async_read");
        handle_connection_lost("TLS read failed");
        return;
      }
    } else {
      bytes_read = recv(sockfd_, buffer, sizeof(buffer), 0);
      if (bytes_read < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          break;
        }
        if (errno == EINTR) {
          continue;
        }
        handle_connection_lost(std::string("Connection lost: ") + strerror(errno));
        return;
      }
      if (bytes_read == 0) {
        handle_connection_lost("Connection closed by server");
        return;
      }
    }
    buffer_.append(buffer, bytes_read);
    got_data = true;
  }

  if (got_data || !buffer_.empty()) {
    bool closed = false;
    std::vector<std::string> messages = process_websocket_frames(&closed);
    auto callback = message_callback_;
    for (const auto& message : messages) {
      if (!running_.load()) {
        return;
      }
      if (callback) {
        callback(message);
      }
    }
    if (closed) {
      handle_connection_lost("Connection closed by server");
      return;
    }
  }

  if (running_.load()) {
    network_thread_->PostDelayedTask([this]() { async_read(); },
                                     webrtc::TimeDelta::Millis(got_data ? 1 : kReadPollMs));
  }
}

void WebSocketClient::handle_connection_lost(const std::string& reason) {
  if (!connected_.exchange(false)) {
    return;
  }
  APP_LOG(AS_WARNING) << "WebSocket to " << config_.host << " lost: " << reason;
  running_ = false;
  cleanup_connection();

  auto callback = std::move(close_callback_);
  close_callback_ = nullptr;
  if (callback) {
    callback(reason);
  }
}

void WebSocketClient::cleanup_connection() {
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  if (ssl_) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
  if (sockfd_ != -1) {
    ::close(sockfd_);
    sockfd_ = -1;
  }
}

void WebSocketClient::log_ssl_error(const std::string& operation) {
  APP_LOG(AS_ERROR) << operation << ": " << ERR_error_string(ERR_get_error(), nullptr);
}
