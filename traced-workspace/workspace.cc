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

#include "workspace.h"
#include "message_codec.h"
#include "google/cloud/log.h"
#include "google/cloud/pubsub/subscription.h"
#include "google/cloud/pubsub/topic.h"
#include <fmt/format.h>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <variant>

namespace traced_workspace {

namespace gc = ::google::cloud;
namespace pubsub = ::google::cloud::pubsub;

namespace {

gc::Status FailedPrecondition(std::string message) {
  return gc::Status(gc::StatusCode::kFailedPrecondition, std::move(message));
}

std::string RandomHex(std::mt19937_64& gen) {
  return fmt::format("{:016x}{:016x}", gen(), gen());
}

std::mt19937_64 MakeGenerator() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  return std::mt19937_64(seq);
}

}  // namespace

class SessionImpl : public std::enable_shared_from_this<SessionImpl> {
 public:
  SessionImpl(SessionConfig config, pubsub::Publisher publisher,
              std::optional<pubsub::Subscriber> subscriber)
      : config_(std::move(config)),
        publisher_(std::move(publisher)),
        subscriber_(std::move(subscriber)),
        generator_(MakeGenerator()),
        id_(RandomHex(generator_)),
        opened_at_(std::chrono::system_clock::now()) {}

  std::string const& id() const { return id_; }

  gc::Status Publish(pubsub::Message message) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return FailedPrecondition("the session is closed");
    }
    auto id = publisher_.Publish(std::move(message)).get();
    if (!id) return std::move(id).status();
    GCP_LOG(DEBUG) << "published message " << *id;
    return gc::Status{};
  }

  gc::StatusOr<ChangeStream> Subscribe(PathExpr expr) {
    auto channel = std::make_shared<Channel<Change>>();
    std::uint64_t listener_id;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return FailedPrecondition("the session is closed");
      listener_id = ++last_listener_id_;
      subscribers_.emplace(listener_id, ChangeListener{std::move(expr), channel});
    }
    auto unregister = [w = weak_from_this(), listener_id] {
      if (auto self = w.lock()) self->RemoveSubscriber(listener_id);
    };
    auto status = StartStreamingPull();
    if (!status.ok()) {
      unregister();
      return status;
    }
    return ChangeStream(std::move(channel), std::move(unregister));
  }

  gc::StatusOr<GetRequestStream> RegisterEval(Path path) {
    auto channel = std::make_shared<Channel<GetRequest>>();
    std::uint64_t listener_id;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return FailedPrecondition("the session is closed");
      listener_id = ++last_listener_id_;
      evals_.emplace(listener_id, EvalListener{std::move(path), channel});
    }
    auto unregister = [w = weak_from_this(), listener_id] {
      if (auto self = w.lock()) self->RemoveEval(listener_id);
    };
    auto status = StartStreamingPull();
    if (!status.ok()) {
      unregister();
      return status;
    }
    return GetRequestStream(std::move(channel), std::move(unregister));
  }

  gc::StatusOr<DataStream> Get(Selector selector) {
    auto channel = std::make_shared<Channel<Data>>();
    std::string query_id;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return FailedPrecondition("the session is closed");
      query_id = RandomHex(generator_);
      queries_.emplace(query_id, channel);
    }
    auto unregister = [w = weak_from_this(), query_id] {
      if (auto self = w.lock()) self->RemoveQuery(query_id);
    };
    auto status = StartStreamingPull();
    if (status.ok()) {
      status =
          Publish(EncodeQuery(QueryMessage{std::move(selector), query_id,
                                           Timestamp::Now(id_)}));
    }
    if (!status.ok()) {
      unregister();
      return status;
    }
    return DataStream(std::move(channel), std::move(unregister),
                      DataStream::Clock::now() + config_.query_timeout);
  }

  gc::Status Close() {
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_) return gc::Status{};
    closed_ = true;
    CloseChannels();
    auto pull = std::move(streaming_pull_);
    streaming_pull_.reset();
    lk.unlock();

    publisher_.Flush();
    if (!pull) return gc::Status{};
    pull->cancel();
    auto status = pull->get();
    if (status.code() == gc::StatusCode::kCancelled) return gc::Status{};
    return status;
  }

 private:
  struct ChangeListener {
    PathExpr expr;
    std::shared_ptr<Channel<Change>> channel;
  };
  struct EvalListener {
    Path path;
    std::shared_ptr<Channel<GetRequest>> channel;
  };

  gc::Status StartStreamingPull() {
    std::lock_guard<std::mutex> start(start_mu_);
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!pull_status_.ok()) return pull_status_;
      if (streaming_pull_) return gc::Status{};
    }
    if (!subscriber_) {
      return FailedPrecondition(
          "subscribe, get and eval require a configured subscription");
    }
    GCP_LOG(INFO) << "starting streaming pull for session " << id_;
    auto pull =
        subscriber_
            ->Subscribe([w = weak_from_this()](pubsub::Message const& m,
                                               pubsub::AckHandler h) {
              if (auto self = w.lock()) self->Dispatch(m);
              std::move(h).ack();
            })
            .then([w = weak_from_this()](gc::future<gc::Status> f) {
              auto status = f.get();
              if (auto self = w.lock()) self->OnStreamingPullDone(status);
              return status;
            });
    std::lock_guard<std::mutex> lk(mu_);
    streaming_pull_ = std::move(pull);
    return gc::Status{};
  }

  void OnStreamingPullDone(gc::Status const& status) {
    if (!status.ok() && status.code() != gc::StatusCode::kCancelled) {
      GCP_LOG(WARNING) << "streaming pull for session " << id_
                       << " ended with " << status;
    }
    std::lock_guard<std::mutex> lk(mu_);
    pull_status_ =
        status.ok() ? gc::Status(gc::StatusCode::kUnavailable,
                                 "the streaming pull has finished")
                    : status;
    CloseChannels();
  }

  void Dispatch(pubsub::Message const& m) {
    auto decoded = DecodeMessage(m);
    if (!decoded) {
      GCP_LOG(WARNING) << "dropping message: " << decoded.status();
      return;
    }
    if (auto const* change = std::get_if<Change>(&*decoded)) {
      if (IsStale(change->timestamp)) return;
      std::lock_guard<std::mutex> lk(mu_);
      for (auto const& kv : subscribers_) {
        auto const& l = kv.second;
        if (l.expr.Matches(change->path)) l.channel->Push(*change);
      }
      return;
    }
    if (auto const* query = std::get_if<QueryMessage>(&*decoded)) {
      if (IsStale(query->timestamp)) return;
      std::lock_guard<std::mutex> lk(mu_);
      for (auto const& kv : evals_) {
        auto const& l = kv.second;
        if (!query->selector.path_expr().Matches(l.path)) continue;
        l.channel->Push(GetRequest(query->selector, MakeReplier(*query)));
      }
      return;
    }
    if (auto const* reply = std::get_if<ReplyMessage>(&*decoded)) {
      std::lock_guard<std::mutex> lk(mu_);
      auto i = queries_.find(reply->query_id);
      // Replies to queries from other sessions are expected, and ignored.
      if (i == queries_.end()) return;
      i->second->Push(reply->data);
    }
  }

  // The subscription may retain messages published before this session
  // opened. Those are not live changes or queries.
  bool IsStale(Timestamp const& ts) const {
    if (ts.time >= opened_at_) return false;
    GCP_LOG(DEBUG) << "dropping message published before the session opened: "
                   << ToString(ts);
    return true;
  }

  GetRequest::Replier MakeReplier(QueryMessage const& query) {
    return [w = weak_from_this(), query_id = query.query_id](
               Path path, Value value) -> gc::Status {
      auto self = w.lock();
      if (!self) return FailedPrecondition("the session is closed");
      return self->Publish(EncodeReply(ReplyMessage{
          query_id, Data{std::move(path), std::move(value),
                         Timestamp::Now(self->id())}}));
    };
  }

  void RemoveSubscriber(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    subscribers_.erase(id);
  }

  void RemoveEval(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    evals_.erase(id);
  }

  void RemoveQuery(std::string const& id) {
    std::lock_guard<std::mutex> lk(mu_);
    queries_.erase(id);
  }

  // Must be called with `mu_` held.
  void CloseChannels() {
    for (auto& kv : subscribers_) kv.second.channel->Close();
    for (auto& kv : evals_) kv.second.channel->Close();
    for (auto& kv : queries_) kv.second->Close();
  }

  SessionConfig const config_;
  pubsub::Publisher publisher_;
  std::optional<pubsub::Subscriber> subscriber_;

  std::mutex start_mu_;
  std::mutex mu_;
  std::mt19937_64 generator_;
  std::string const id_;
  std::chrono::system_clock::time_point const opened_at_;
  bool closed_ = false;
  gc::Status pull_status_;
  std::optional<gc::future<gc::Status>> streaming_pull_;
  std::uint64_t last_listener_id_ = 0;
  std::map<std::uint64_t, ChangeListener> subscribers_;
  std::map<std::uint64_t, EvalListener> evals_;
  std::map<std::string, std::shared_ptr<Channel<Data>>> queries_;
};

gc::StatusOr<Path> Workspace::Resolve(Path const& path) const {
  auto resolved = prefix_ ? path.WithPrefix(*prefix_) : path;
  if (resolved.IsRelative()) {
    return gc::Status(
        gc::StatusCode::kInvalidArgument,
        fmt::format("relative path <{}> used in a workspace without prefix",
                    path.str()));
  }
  return resolved;
}

gc::StatusOr<Selector> Workspace::Resolve(Selector const& selector) const {
  auto resolved = prefix_ ? selector.WithPrefix(*prefix_) : selector;
  if (resolved.path_expr().IsRelative()) {
    return gc::Status(
        gc::StatusCode::kInvalidArgument,
        fmt::format("relative selector <{}> used in a workspace without prefix",
                    selector.ToString()));
  }
  return resolved;
}

gc::Status Workspace::Put(Path const& path, Value value) {
  auto resolved = Resolve(path);
  if (!resolved) return std::move(resolved).status();
  return impl_->Publish(EncodeChange(Change{*std::move(resolved),
                                            ChangeKind::kPut, std::move(value),
                                            Timestamp::Now(impl_->id())}));
}

gc::Status Workspace::Delete(Path const& path) {
  auto resolved = Resolve(path);
  if (!resolved) return std::move(resolved).status();
  return impl_->Publish(
      EncodeChange(Change{*std::move(resolved), ChangeKind::kDelete,
                          std::nullopt, Timestamp::Now(impl_->id())}));
}

gc::StatusOr<ChangeStream> Workspace::Subscribe(Selector const& selector) {
  auto resolved = Resolve(selector);
  if (!resolved) return std::move(resolved).status();
  return impl_->Subscribe(resolved->path_expr());
}

gc::StatusOr<DataStream> Workspace::Get(Selector const& selector) {
  auto resolved = Resolve(selector);
  if (!resolved) return std::move(resolved).status();
  return impl_->Get(*std::move(resolved));
}

gc::StatusOr<GetRequestStream> Workspace::RegisterEval(Path const& path) {
  auto resolved = Resolve(path);
  if (!resolved) return std::move(resolved).status();
  return impl_->RegisterEval(*std::move(resolved));
}

gc::StatusOr<Session> Session::Open(Properties const& properties) {
  auto config = ParseSessionConfig(properties);
  if (!config) return std::move(config).status();
  auto const options = ConnectionOptions(*config);

  auto publisher = pubsub::Publisher(pubsub::MakePublisherConnection(
      pubsub::Topic(config->project_id, config->topic_id), options));
  std::optional<pubsub::Subscriber> subscriber;
  if (!config->subscription_id.empty()) {
    subscriber = pubsub::Subscriber(pubsub::MakeSubscriberConnection(
        pubsub::Subscription(config->project_id, config->subscription_id),
        options));
  }
  return Create(*std::move(config), std::move(publisher),
                std::move(subscriber));
}

Session Session::Create(SessionConfig config, pubsub::Publisher publisher,
                        std::optional<pubsub::Subscriber> subscriber) {
  return Session(std::make_shared<SessionImpl>(
      std::move(config), std::move(publisher), std::move(subscriber)));
}

std::string const& Session::id() const { return impl_->id(); }

Workspace Session::NewWorkspace(std::optional<Path> prefix) const {
  return Workspace(impl_, std::move(prefix));
}

gc::Status Session::Close() { return impl_->Close(); }

}  // namespace traced_workspace
