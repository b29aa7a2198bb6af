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

#ifndef TRACED_WORKSPACE_WORKSPACE_H
#define TRACED_WORKSPACE_WORKSPACE_H

#include "change.h"
#include "path.h"
#include "properties.h"
#include "session_config.h"
#include "stream.h"
#include "value.h"
#include "google/cloud/pubsub/publisher.h"
#include "google/cloud/pubsub/subscriber.h"
#include "google/cloud/status_or.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace traced_workspace {

class SessionImpl;

// A query received by an eval. Each call to `Reply()` sends one `Data` back
// to the session that issued the get.
class GetRequest {
 public:
  using Replier = std::function<google::cloud::Status(Path, Value)>;

  GetRequest(Selector selector, Replier replier)
      : selector_(std::move(selector)), replier_(std::move(replier)) {}

  Selector const& selector() const { return selector_; }

  google::cloud::Status Reply(Path path, Value value) const {
    return replier_(std::move(path), std::move(value));
  }

 private:
  Selector selector_;
  Replier replier_;
};

using ChangeStream = Stream<Change>;
using DataStream = Stream<Data>;
using GetRequestStream = Stream<GetRequest>;

// Issues put, delete, get, subscribe and eval calls. Relative paths and
// selectors are resolved against the workspace prefix.
class Workspace {
 public:
  std::optional<Path> const& prefix() const { return prefix_; }

  google::cloud::Status Put(Path const& path, Value value);
  google::cloud::Status Delete(Path const& path);

  // Returns the changes on all the paths matching `selector`.
  google::cloud::StatusOr<ChangeStream> Subscribe(Selector const& selector);

  // Sends a query to all the evals matching `selector`. The returned stream
  // ends when the session query timeout expires.
  google::cloud::StatusOr<DataStream> Get(Selector const& selector);

  // Receives the gets whose selector matches `path`.
  google::cloud::StatusOr<GetRequestStream> RegisterEval(Path const& path);

 private:
  friend class Session;
  Workspace(std::shared_ptr<SessionImpl> impl, std::optional<Path> prefix)
      : impl_(std::move(impl)), prefix_(std::move(prefix)) {}

  google::cloud::StatusOr<Path> Resolve(Path const& path) const;
  google::cloud::StatusOr<Selector> Resolve(Selector const& selector) const;

  std::shared_ptr<SessionImpl> impl_;
  std::optional<Path> prefix_;
};

// A connection to the Pub/Sub topic shared by all the workspaces.
//
// Each session owns at most one streaming pull on its subscription, and
// dispatches the messages it receives to the local streams.
class Session {
 public:
  static google::cloud::StatusOr<Session> Open(Properties const& properties);

  // Use pre-built connections, mostly useful in tests.
  static Session Create(
      SessionConfig config, google::cloud::pubsub::Publisher publisher,
      std::optional<google::cloud::pubsub::Subscriber> subscriber);

  // The source id stamped on every value this session produces.
  std::string const& id() const;

  Workspace NewWorkspace(std::optional<Path> prefix = std::nullopt) const;

  // Cancels the streaming pull and closes all the streams.
  google::cloud::Status Close();

 private:
  explicit Session(std::shared_ptr<SessionImpl> impl)
      : impl_(std::move(impl)) {}

  std::shared_ptr<SessionImpl> impl_;
};

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_WORKSPACE_H
