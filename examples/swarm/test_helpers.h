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

#ifndef EXAMPLES_SWARM_TEST_HELPERS_H_
#define EXAMPLES_SWARM_TEST_HELPERS_H_

#include <functional>

#include <rtc_base/thread.h>
#include <rtc_base/time_utils.h>

// Runs the current thread's queue until condition holds or timeout_ms
// elapses. Returns the final value of condition.
inline bool WaitFor(const std::function<bool()>& condition, int timeout_ms = 2000) {
  const int64_t deadline = rtc::TimeMillis() + timeout_ms;
  while (!condition()) {
    if (rtc::TimeMillis() >= deadline) {
      return condition();
    }
    rtc::Thread::Current()->ProcessMessages(5);
  }
  return true;
}

// Runs the current thread's queue for duration_ms.
inline void RunFor(int duration_ms) {
  const int64_t deadline = rtc::TimeMillis() + duration_ms;
  while (rtc::TimeMillis() < deadline) {
    rtc::Thread::Current()->ProcessMessages(5);
  }
}

#endif  // EXAMPLES_SWARM_TEST_HELPERS_H_
