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

#ifndef TRACED_WORKSPACE_FAKE_PUBSUB_H
#define TRACED_WORKSPACE_FAKE_PUBSUB_H

#include "message_codec.h"
#include "session_config.h"
#include "workspace.h"
#include "google/cloud/future.h"
#include "google/cloud/pubsub/mocks/mock_ack_handler.h"
#include "google/cloud/pubsub/mocks/mock_publisher_connection.h"
#include "google/cloud/pubsub/mocks/mock_subscriber_connection.h"
#include <gmock/gmock.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace traced_workspace {
namespace testing_util {

// Wires mock Pub/Sub connections into a `Session`. Published messages are
// recorded, and `Deliver()` feeds messages to the session's streaming pull.
class FakePubSub {
 public:
  using PublishHook = std::function<void(google::cloud::pubsub::Message const&)>;

  FakePubSub()
      : publisher_(std::make_shared<::testing::NiceMock<
                       google::cloud::pubsub_mocks::MockPublisherConnection>>()),
        subscriber_(std::make_shared<::testing::NiceMock<
                        google::cloud::pubsub_mocks::MockSubscriberConnection>>()) {
    ON_CALL(*publisher_, Publish)
        .WillByDefault(
            [this](google::cloud::pubsub::PublisherConnection::PublishParams
                       const& p) {
              PublishHook hook;
              std::string id;
              {
                std::lock_guard<std::mutex> lk(mu_);
                published_.push_back(p.message);
                id = "message-" + std::to_string(published_.size());
                hook = on_publish_;
              }
              if (hook) hook(p.message);
              return google::cloud::make_ready_future(
                  google::cloud::StatusOr<std::string>(std::move(id)));
            });
    ON_CALL(*subscriber_, Subscribe)
        .WillByDefault(
            [this](google::cloud::pubsub::SubscriberConnection::SubscribeParams
                       p) {
              std::lock_guard<std::mutex> lk(mu_);
              ++subscribe_calls_;
              callback_ = std::move(p.callback);
              // Cancelling the pull completes it from another thread, as the
              // client library does.
              pull_.emplace([this] {
                std::lock_guard<std::mutex> lk(mu_);
                ++cancel_calls_;
                cancellations_.emplace_back([this] {
                  FinishPull(google::cloud::Status(
                      google::cloud::StatusCode::kCancelled, "cancelled"));
                });
              });
              return pull_->get_future();
            });
  }

  ~FakePubSub() {
    std::vector<std::thread> cancellations;
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancellations.swap(cancellations_);
    }
    for (auto& t : cancellations) t.join();
  }

  static SessionConfig DefaultConfig() {
    SessionConfig config;
    config.project_id = "test-project";
    config.subscription_id = "test-subscription";
    config.query_timeout = std::chrono::milliseconds(100);
    return config;
  }

  Session MakeSession(SessionConfig config = DefaultConfig(),
                      bool with_subscriber = true) {
    std::optional<google::cloud::pubsub::Subscriber> subscriber;
    if (with_subscriber) subscriber.emplace(subscriber_);
    return Session::Create(std::move(config),
                           google::cloud::pubsub::Publisher(publisher_),
                           std::move(subscriber));
  }

  // Called with each published message, after it is recorded.
  void OnPublish(PublishHook hook) {
    std::lock_guard<std::mutex> lk(mu_);
    on_publish_ = std::move(hook);
  }

  // Delivers `m` to the streaming pull, and expects the session to ack it.
  void Deliver(google::cloud::pubsub::Message m) {
    auto ack = std::make_unique<
        ::testing::StrictMock<google::cloud::pubsub_mocks::MockAckHandler>>();
    EXPECT_CALL(*ack, ack()).Times(1);
    std::function<void(google::cloud::pubsub::Message,
                       google::cloud::pubsub::AckHandler)>
        callback;
    {
      std::lock_guard<std::mutex> lk(mu_);
      callback = callback_;
    }
    ASSERT_TRUE(callback) << "the streaming pull is not running";
    callback(std::move(m), google::cloud::pubsub::AckHandler(std::move(ack)));
  }

  // Completes the streaming pull with `status`.
  void FinishPull(google::cloud::Status status) {
    std::optional<google::cloud::promise<google::cloud::Status>> pull;
    {
      std::lock_guard<std::mutex> lk(mu_);
      pull.swap(pull_);
    }
    if (pull) pull->set_value(std::move(status));
  }

  std::vector<google::cloud::pubsub::Message> published() const {
    std::lock_guard<std::mutex> lk(mu_);
    return published_;
  }

  int subscribe_calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subscribe_calls_;
  }

  int cancel_calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancel_calls_;
  }

  google::cloud::pubsub_mocks::MockPublisherConnection& publisher() {
    return *publisher_;
  }

 private:
  std::shared_ptr<
      ::testing::NiceMock<google::cloud::pubsub_mocks::MockPublisherConnection>>
      publisher_;
  std::shared_ptr<::testing::NiceMock<
      google::cloud::pubsub_mocks::MockSubscriberConnection>>
      subscriber_;

  mutable std::mutex mu_;
  std::vector<google::cloud::pubsub::Message> published_;
  PublishHook on_publish_;
  int subscribe_calls_ = 0;
  int cancel_calls_ = 0;
  std::vector<std::thread> cancellations_;
  std::function<void(google::cloud::pubsub::Message,
                     google::cloud::pubsub::AckHandler)>
      callback_;
  std::optional<google::cloud::promise<google::cloud::Status>> pull_;
};

// Answers each query published on `fake` with `value`, as an eval on `path`
// would.
inline void ReplyToQueries(FakePubSub& fake, Path path, Value value) {
  fake.OnPublish([&fake, path = std::move(path),
                  value = std::move(value)](
                     google::cloud::pubsub::Message const& m) {
    auto decoded = DecodeMessage(m);
    if (!decoded) return;
    auto const* query = std::get_if<QueryMessage>(&*decoded);
    if (query == nullptr) return;
    fake.Deliver(EncodeReply(ReplyMessage{
        query->query_id,
        Data{path, value, Timestamp::Now("replying-session")}}));
  });
}

}  // namespace testing_util
}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_FAKE_PUBSUB_H
