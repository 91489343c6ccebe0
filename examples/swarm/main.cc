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

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <rtc_base/ssl_adapter.h>
#include <rtc_base/thread.h>

#include "client.h"
#include "option.h"
#include "relay_channel.h"
#include "swarm.h"
#include "webrtc_transport.h"

static volatile bool g_shutdown = false;
static volatile int g_shutdown_count = 0;

// Signal handler for Ctrl+C
void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_shutdown_count++;
        std::cout << "\nCtrl+C received (" << g_shutdown_count << "/3), shutting down...\n";
        g_shutdown = true;

        if (g_shutdown_count >= 3) {
            std::cout << "Force exit after multiple Ctrl+C signals\n";
            std::cout.flush();
            _exit(1);
        }

        if (g_shutdown_count >= 2) {
            std::thread([]() {
                std::this_thread::sleep_for(std::chrono::seconds(2));
                std::cout << "Force exit due to timeout\n";
                std::cout.flush();
                _exit(1);
            }).detach();
        }
    }
}

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  SwarmOptions opts = parseOptions(args);

  if (opts.help) {
    fprintf(stderr, "%s\n", opts.help_string.c_str());
    return 1;
  }

  signal(SIGINT, signalHandler);
  signal(SIGPIPE, SIG_IGN);

  SwarmSetLoggingLevel(opts.verbose ? rtc::LS_VERBOSE : rtc::LS_INFO);
  std::unique_ptr<StructuredLogSink> json_sink;
  if (opts.log_json) {
    // JSON lines replace the plain debug output.
    SwarmSetLoggingLevel(rtc::LS_NONE);
    json_sink = std::make_unique<StructuredLogSink>([](const LogRecord& record) {
      fprintf(stderr, "%s\n", SwarmFormatLogRecord(record).c_str());
    });
    SwarmAddLogSink(json_sink.get(), opts.verbose ? rtc::LS_VERBOSE : rtc::LS_INFO);
  }

  SwarmResolveOptions(&opts);
  std::string error;
  if (!ValidateSwarmOptions(opts, &error)) {
    fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  APP_LOG(AS_INFO) << getUsage(opts);

  rtc::InitializeSSL();
  int exit_code = 0;
  {
    rtc::AutoThread main_thread;

    WebRtcTransportFactory transport_factory(opts.ice_servers);
    if (!transport_factory.Initialize()) {
      fprintf(stderr, "Failed to initialize WebRTC\n");
      if (json_sink) {
        SwarmRemoveLogSink(json_sink.get());
      }
      rtc::CleanupSSL();
      return 1;
    }
    WebSocketRelayChannelFactory relay_factory;

    // Sessions handed over by the client, by remote peer id.
    std::map<std::string, std::shared_ptr<PeerSession>> peers;
    bool closed = false;

    {
      PeerDiscoveryClient client(opts, &transport_factory, &relay_factory);

      client.AddHandler(DiscoveryEventType::kReady, [&client](const DiscoveryEvent&) {
        APP_LOG(AS_INFO) << "Announcing " << client.info_hash() << " as "
                         << client.peer_id();
      });
      client.AddHandler(
          DiscoveryEventType::kPeerConnected,
          [&peers, &opts](const DiscoveryEvent& event) {
            std::shared_ptr<PeerSession> session = event.session;
            const std::string remote = event.peer_id;
            peers[remote] = session;
            session->AddHandler(SessionEventType::kData,
                                [remote](const SessionEvent& data) {
                                  printf("%s: %s\n", remote.c_str(),
                                         data.data.c_str());
                                  fflush(stdout);
                                });
            printf("Connected to %s\n", remote.c_str());
            fflush(stdout);
            if (!session->Send(opts.greeting)) {
              APP_LOG(AS_WARNING) << "Failed to greet " << remote;
            }
          });
      client.AddHandler(DiscoveryEventType::kPeerDisconnected,
                        [&peers](const DiscoveryEvent& event) {
                          printf("Disconnected from %s\n", event.peer_id.c_str());
                          fflush(stdout);
                          peers.erase(event.peer_id);
                        });
      client.AddHandler(DiscoveryEventType::kPeerFailed,
                        [&peers](const DiscoveryEvent& event) {
                          APP_LOG(AS_WARNING) << "Peer " << event.peer_id
                                              << " failed: " << event.error.message;
                          peers.erase(event.peer_id);
                        });
      client.AddHandler(DiscoveryEventType::kStatsUpdate,
                        [](const DiscoveryEvent& event) {
                          APP_LOG(AS_INFO) << event.relay_url << ": "
                                           << event.complete << " seeders, "
                                           << event.incomplete << " leechers";
                        });
      client.AddHandler(DiscoveryEventType::kRelayFailure,
                        [](const DiscoveryEvent& event) {
                          APP_LOG(AS_WARNING) << event.relay_url
                                              << " refused: " << event.reason;
                        });
      client.AddHandler(DiscoveryEventType::kClosed,
                        [&closed](const DiscoveryEvent& event) {
                          APP_LOG(AS_ERROR) << "Discovery closed: " << event.reason;
                          closed = true;
                        });

      bool started = client.Start([&closed, &exit_code](const SwarmError& error) {
        if (!error.ok()) {
          fprintf(stderr, "Failed to join the swarm: %s\n", error.message.c_str());
          exit_code = 1;
          closed = true;
        }
      });
      if (!started) {
        exit_code = 1;
        closed = true;
      }

      while (!g_shutdown && !closed) {
        rtc::Thread::Current()->ProcessMessages(100);
      }

      client.Stop();
    }

    for (auto& entry : peers) {
      entry.second->Close();
    }
    peers.clear();
    // Let the transports finish closing before the factory goes away.
    rtc::Thread::Current()->ProcessMessages(100);
  }

  if (json_sink) {
    SwarmRemoveLogSink(json_sink.get());
  }
  rtc::CleanupSSL();
  return exit_code;
}
