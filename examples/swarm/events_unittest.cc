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

#include "events.h"

#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class TestEvent { kOne, kTwo };

using Dispatcher = EventDispatcher<TestEvent, std::string>;

}  // namespace

TEST(EventDispatcher, DeliversToHandlersOfThatTypeInOrder) {
  Dispatcher dispatcher;
  std::vector<std::string> calls;
  dispatcher.AddHandler(TestEvent::kOne,
                        [&](const std::string& p) { calls.push_back("a:" + p); });
  dispatcher.AddHandler(TestEvent::kTwo,
                        [&](const std::string& p) { calls.push_back("x:" + p); });
  dispatcher.AddHandler(TestEvent::kOne,
                        [&](const std::string& p) { calls.push_back("b:" + p); });

  dispatcher.Emit(TestEvent::kOne, "1");
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], "a:1");
  EXPECT_EQ(calls[1], "b:1");
  EXPECT_EQ(dispatcher.handler_count(TestEvent::kOne), 2u);
  EXPECT_EQ(dispatcher.handler_count(TestEvent::kTwo), 1u);
}

TEST(EventDispatcher, RemovedHandlerIsNotCalled) {
  Dispatcher dispatcher;
  int calls = 0;
  int id = dispatcher.AddHandler(TestEvent::kOne, [&](const std::string&) { ++calls; });
  dispatcher.RemoveHandler(id);
  dispatcher.Emit(TestEvent::kOne, "");
  EXPECT_EQ(calls, 0);
  // Unknown ids are ignored.
  dispatcher.RemoveHandler(12345);
}

TEST(EventDispatcher, HandlerAddedDuringEmitWaitsForNextEmit) {
  Dispatcher dispatcher;
  int late_calls = 0;
  dispatcher.AddHandler(TestEvent::kOne, [&](const std::string&) {
    dispatcher.AddHandler(TestEvent::kOne, [&](const std::string&) { ++late_calls; });
  });
  dispatcher.Emit(TestEvent::kOne, "");
  EXPECT_EQ(late_calls, 0);
  dispatcher.Emit(TestEvent::kOne, "");
  EXPECT_EQ(late_calls, 1);
}

TEST(EventDispatcher, HandlerRemovedByEarlierHandlerIsSkipped) {
  Dispatcher dispatcher;
  int second_calls = 0;
  int second = 0;
  dispatcher.AddHandler(TestEvent::kOne,
                        [&](const std::string&) { dispatcher.RemoveHandler(second); });
  second = dispatcher.AddHandler(TestEvent::kOne,
                                 [&](const std::string&) { ++second_calls; });
  dispatcher.Emit(TestEvent::kOne, "");
  EXPECT_EQ(second_calls, 0);
}

TEST(EventDispatcher, HandlerMayRemoveItself) {
  Dispatcher dispatcher;
  int calls = 0;
  int id = 0;
  id = dispatcher.AddHandler(TestEvent::kOne, [&](const std::string&) {
    ++calls;
    dispatcher.RemoveHandler(id);
  });
  dispatcher.Emit(TestEvent::kOne, "");
  dispatcher.Emit(TestEvent::kOne, "");
  EXPECT_EQ(calls, 1);
}

TEST(EventDispatcher, HandlerMayDestroyDispatcher) {
  auto dispatcher = std::make_unique<Dispatcher>();
  int after = 0;
  dispatcher->AddHandler(TestEvent::kOne,
                         [&](const std::string&) { dispatcher.reset(); });
  dispatcher->AddHandler(TestEvent::kOne, [&](const std::string&) { ++after; });
  dispatcher->Emit(TestEvent::kOne, "");
  EXPECT_EQ(dispatcher, nullptr);
  EXPECT_EQ(after, 0);
}

TEST(EventDispatcher, ThrowingHandlerDoesNotBlockOthers) {
  Dispatcher dispatcher;
  std::vector<std::string> calls;
  dispatcher.AddHandler(TestEvent::kOne, [](const std::string& p) {
    // Reading a string as a number throws Json::LogicError.
    Json::Value value(p);
    static_cast<void>(value.asInt());
  });
  dispatcher.AddHandler(TestEvent::kOne,
                        [&](const std::string& p) { calls.push_back("b:" + p); });
  dispatcher.AddHandler(TestEvent::kOne,
                        [](const std::string&) { throw std::runtime_error("boom"); });
  dispatcher.AddHandler(TestEvent::kOne,
                        [&](const std::string& p) { calls.push_back("d:" + p); });

  EXPECT_NO_THROW(dispatcher.Emit(TestEvent::kOne, "scrape"));
  EXPECT_EQ(calls, (std::vector<std::string>{"b:scrape", "d:scrape"}));

  // The throwing handlers stay registered.
  EXPECT_EQ(dispatcher.handler_count(TestEvent::kOne), 4u);
  calls.clear();
  dispatcher.Emit(TestEvent::kOne, "again");
  EXPECT_EQ(calls.size(), 2u);
}

TEST(EventDispatcher, RemoveAllHandlers) {
  Dispatcher dispatcher;
  int calls = 0;
  dispatcher.AddHandler(TestEvent::kOne, [&](const std::string&) { ++calls; });
  dispatcher.AddHandler(TestEvent::kTwo, [&](const std::string&) { ++calls; });
  dispatcher.RemoveAllHandlers();
  dispatcher.Emit(TestEvent::kOne, "");
  dispatcher.Emit(TestEvent::kTwo, "");
  EXPECT_EQ(calls, 0);
}
