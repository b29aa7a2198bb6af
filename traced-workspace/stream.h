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

#ifndef TRACED_WORKSPACE_STREAM_H
#define TRACED_WORKSPACE_STREAM_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace traced_workspace {

// A queue filled by the Pub/Sub callbacks and drained by the application.
template <typename T>
class Channel {
 public:
  // Returns false, and drops `value`, if the channel is closed.
  bool Push(T value) {
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_) return false;
    queue_.push_back(std::move(value));
    lk.unlock();
    cv_.notify_one();
    return true;
  }

  // Items already queued can still be popped after `Close()`.
  void Close() {
    std::unique_lock<std::mutex> lk(mu_);
    closed_ = true;
    lk.unlock();
    cv_.notify_all();
  }

  void Clear() {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.clear();
  }

  std::optional<T> Pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
    return PopLocked();
  }

  std::optional<T> Pop(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, deadline, [this] { return !queue_.empty() || closed_; });
    return PopLocked();
  }

  // True once the channel is closed and all the queued items are consumed.
  bool exhausted() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_ && queue_.empty();
  }

 private:
  std::optional<T> PopLocked() {
    if (queue_.empty()) return std::nullopt;
    auto value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

// The application side of a `Channel`.
//
// Streams returned by a get have a deadline: once it expires the stream is
// closed, even if more replies could arrive later.
template <typename T>
class Stream {
 public:
  using Clock = std::chrono::steady_clock;

  Stream(std::shared_ptr<Channel<T>> channel, std::function<void()> on_close,
         std::optional<Clock::time_point> deadline = std::nullopt)
      : channel_(std::move(channel)),
        on_close_(std::move(on_close)),
        deadline_(deadline) {}

  Stream(Stream&&) noexcept = default;
  Stream& operator=(Stream&& rhs) {
    if (this == &rhs) return *this;
    Close();
    channel_ = std::move(rhs.channel_);
    on_close_ = std::move(rhs.on_close_);
    rhs.on_close_ = nullptr;
    deadline_ = rhs.deadline_;
    return *this;
  }
  Stream(Stream const&) = delete;
  Stream& operator=(Stream const&) = delete;

  ~Stream() { Close(); }

  // Blocks until the next item, or returns `std::nullopt` once the stream is
  // closed (or its deadline expired).
  std::optional<T> Next() {
    if (!channel_) return std::nullopt;
    if (!deadline_) return channel_->Pop();
    return Wait(*deadline_);
  }

  // Like `Next()`, but gives up after `timeout`. Use `closed()` to tell a
  // timeout from the end of the stream.
  std::optional<T> Next(std::chrono::milliseconds timeout) {
    if (!channel_) return std::nullopt;
    auto limit = Clock::now() + timeout;
    if (deadline_ && *deadline_ < limit) limit = *deadline_;
    return Wait(limit);
  }

  bool closed() const { return !channel_ || channel_->exhausted(); }

  void Close() {
    if (!channel_) return;
    channel_->Close();
    channel_->Clear();
    if (on_close_) on_close_();
    on_close_ = nullptr;
  }

 private:
  std::optional<T> Wait(Clock::time_point limit) {
    auto value = channel_->Pop(limit);
    if (!value && deadline_ && Clock::now() >= *deadline_) Close();
    return value;
  }

  std::shared_ptr<Channel<T>> channel_;
  std::function<void()> on_close_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_STREAM_H
