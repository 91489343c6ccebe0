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

#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <rtc_base/thread.h>

#include "swarm.h"

// Minimal RFC 6455 client: text frames out, text frames in, ping/pong and
// close handling. Every method except the static helpers must run on the
// network thread given to set_network_thread().
class SWARM_API WebSocketClient {
public:
    struct Config {
        std::string host;
        std::string port;
        std::string path = "/";
        bool use_ssl = false;
        std::map<std::string, std::string> headers;
        // Bounds the TCP connect, TLS handshake and HTTP upgrade.
        int timeout_ms = 10000;
    };

    struct Frame {
        uint8_t opcode = 0;
        bool fin = true;
        std::string payload;
    };

    // Larger frames, or fragmented messages, are a protocol violation.
    static constexpr uint64_t kMaxMessageSize = 16 * 1024 * 1024;

    enum Opcode : uint8_t {
        kContinuation = 0x0,
        kText = 0x1,
        kBinary = 0x2,
        kClose = 0x8,
        kPing = 0x9,
        kPong = 0xA,
    };

    WebSocketClient();
    ~WebSocketClient();

    // Connection management
    bool connect(const Config& config);
    void disconnect();
    bool is_connected() const;

    // Message handling
    bool send_message(const std::string& message);
    void set_message_callback(std::function<void(const std::string&)> callback);
    // Called once when the server closes or the socket fails. Not called
    // for disconnect().
    void set_close_callback(std::function<void(const std::string& reason)> callback);
    void start_listening();

    void set_network_thread(rtc::Thread* thread);

    // Ping/Pong handling
    void send_ping();
    void send_pong_frame(const std::string& ping_payload);

    // WebSocket utilities
    static std::string generate_websocket_key();
    static std::string base64_encode(const std::string& in);
    static std::string encode_frame(uint8_t opcode, const std::string& payload, bool masked);
    // Consumes every complete frame at the front of buffer. Returns false on
    // a protocol violation, leaving the offending bytes in place.
    static bool decode_frames(std::string* buffer, std::vector<Frame>* frames);
    // Adds a text, binary or continuation frame to the message being
    // assembled in fragments; finished messages go to messages. Returns
    // false when the message outgrows kMaxMessageSize.
    static bool reassemble(Frame* frame,
                           std::string* fragments,
                           bool* in_fragment,
                           std::vector<std::string>* messages);

private:
    // Connection state
    int sockfd_;
    SSL_CTX* ssl_ctx_;
    SSL* ssl_;
    bool use_ssl_;
    std::atomic<bool> running_;
    std::atomic<bool> connected_;

    // Configuration
    Config config_;
    rtc::Thread* network_thread_;

    // Message handling
    std::string buffer_;
    std::string fragments_;
    bool in_fragment_;
    std::function<void(const std::string&)> message_callback_;
    std::function<void(const std::string&)> close_callback_;

    std::mutex ssl_mutex_;

    // Internal methods
    bool create_socket_connection();
    bool setup_ssl_context();
    bool perform_ssl_handshake();
    bool send_http_handshake();
    bool write_all(const std::string& bytes);

    // Frame handling
    std::vector<std::string> process_websocket_frames(bool* closed);

    // Async operations
    void async_read();
    void schedule_ping();
    void handle_connection_lost(const std::string& reason);

    // Utility methods
    void cleanup_connection();
    void log_ssl_error(const std::string& operation);
};
