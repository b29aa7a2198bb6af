// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "stream.h"
#include <gmock/gmock.h>
#include <chrono>
#include <future>
#include <thread>

namespace traced_workspace {
namespace {

using ms = std::chrono::milliseconds;

TEST(StreamTest, NextReturnsItemsInOrder) {
  auto channel = std::make_shared<Channel<int>>();
  Stream<int> stream(channel, nullptr);
  EXPECT_TRUE(channel->Push(1));
  EXPECT_TRUE(channel->Push(2));
  EXPECT_EQ(stream.Next(), std::optional<int>(1));
  EXPECT_EQ(stream.Next(ms(0)), std::optional<int>(2));
  EXPECT_FALSE(stream.Next(ms(0)).has_value());
  EXPECT_FALSE(stream.closed());
}

TEST(StreamTest, NextBlocksUntilPush) {
  auto channel = std::make_shared<Channel<int>>();
  Stream<int> stream(channel, nullptr);
  auto pusher = std::async(std::launch::async, [channel] {
    std::this_thread::sleep_for(ms(20));
    channel->Push(42);
  });
  EXPECT_EQ(stream.Next(), std::optional<int>(42));
  pusher.get();
}

TEST(StreamTest, ChannelCloseDrainsQueuedItems) {
  auto channel = std::make_shared<Channel<int>>();
  Stream<int> stream(channel, nullptr);
  channel->Push(1);
  channel->Close();
  EXPECT_FALSE(channel->Push(2));
  EXPECT_FALSE(stream.closed());
  EXPECT_EQ(stream.Next(), std::optional<int>(1));
  EXPECT_FALSE(stream.Next().has_value());
  EXPECT_TRUE(stream.closed());
}

TEST(StreamTest, CloseRunsCallbackOnce) {
  int calls = 0;
  auto channel = std::make_shared<Channel<int>>();
  {
    Stream<int> stream(channel, [&calls] { ++calls; });
    channel->Push(1);
    stream.Close();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(stream.closed());
    EXPECT_FALSE(stream.Next().has_value());
    stream.Close();
  }
  EXPECT_EQ(calls, 1);
}

TEST(StreamTest, DestructorCloses) {
  int calls = 0;
  auto channel = std::make_shared<Channel<int>>();
  { Stream<int> stream(channel, [&calls] { ++calls; }); }
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(channel->Push(1));
}

TEST(StreamTest, MoveTransfersOwnership) {
  int a_calls = 0;
  int b_calls = 0;
  Stream<int> a(std::make_shared<Channel<int>>(), [&a_calls] { ++a_calls; });
  Stream<int> b(std::make_shared<Channel<int>>(), [&b_calls] { ++b_calls; });
  b = std::move(a);
  EXPECT_EQ(b_calls, 1);
  EXPECT_EQ(a_calls, 0);
  Stream<int> c(std::move(b));
  c.Close();
  EXPECT_EQ(a_calls, 1);
}

TEST(StreamTest, DeadlineEndsTheStream) {
  auto channel = std::make_shared<Channel<int>>();
  Stream<int> stream(channel, nullptr, Stream<int>::Clock::now() + ms(30));
  channel->Push(1);
  EXPECT_EQ(stream.Next(), std::optional<int>(1));
  auto const start = Stream<int>::Clock::now();
  EXPECT_FALSE(stream.Next(ms(5000)).has_value());
  EXPECT_LT(Stream<int>::Clock::now() - start, ms(5000));
  EXPECT_TRUE(stream.closed());
}

}  // namespace
}  // namespace traced_workspace
