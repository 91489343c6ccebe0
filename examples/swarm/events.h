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

#ifndef EXAMPLES_SWARM_EVENTS_H_
#define EXAMPLES_SWARM_EVENTS_H_

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "rtc_base/logging.h"

// Handler table keyed by a typed event enumeration.
//
// Emit() walks a snapshot of the handlers registered for the event, so a
// handler may add or remove handlers, or destroy the dispatcher itself,
// without disturbing the remaining invocations. A handler removed by an
// earlier one in the same Emit() is skipped. A handler that throws is logged
// and the next one still runs. Single-threaded.
template <typename EventType, typename Payload>
class EventDispatcher {
 public:
  using Handler = std::function<void(const Payload&)>;

  EventDispatcher() : alive_(std::make_shared<bool>(true)) {}
  ~EventDispatcher() { *alive_ = false; }

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  // Returns an id for RemoveHandler.
  int AddHandler(EventType type, Handler handler) {
    int id = next_id_++;
    entries_.push_back(
        Entry{id, type, std::make_shared<Handler>(std::move(handler))});
    return id;
  }

  void RemoveHandler(int id) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [id](const Entry& e) { return e.id == id; }),
                   entries_.end());
  }

  void RemoveAllHandlers() { entries_.clear(); }

  size_t handler_count(EventType type) const {
    return std::count_if(entries_.begin(), entries_.end(),
                         [type](const Entry& e) { return e.type == type; });
  }

  void Emit(EventType type, const Payload& payload) {
    std::vector<Entry> snapshot;
    for (const auto& entry : entries_) {
      if (entry.type == type) {
        snapshot.push_back(entry);
      }
    }

    std::shared_ptr<bool> alive = alive_;
    for (const auto& entry : snapshot) {
      if (!*alive) {
        return;
      }
      if (!IsRegistered(entry.id)) {
        continue;
      }
      if (!*entry.handler) {
        continue;
      }
      try {
        (*entry.handler)(payload);
      } catch (const std::exception& e) {
        RTC_LOG(LS_ERROR) << "Event handler " << entry.id << " threw: " << e.what();
      }
    }
  }

 private:
  struct Entry {
    int id;
    EventType type;
    std::shared_ptr<Handler> handler;
  };

  bool IsRegistered(int id) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [id](const Entry& e) { return e.id == id; });
  }

  std::vector<Entry> entries_;
  int next_id_ = 1;
  std::shared_ptr<bool> alive_;
};

#endif  // EXAMPLES_SWARM_EVENTS_H_
