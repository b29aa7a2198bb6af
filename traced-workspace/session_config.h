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

#ifndef TRACED_WORKSPACE_SESSION_CONFIG_H
#define TRACED_WORKSPACE_SESSION_CONFIG_H

#include "properties.h"
#include "google/cloud/options.h"
#include "google/cloud/status_or.h"
#include <chrono>
#include <string>
#include <vector>

namespace traced_workspace {

inline auto constexpr kDefaultTopic = "traced-workspace";
inline auto constexpr kDefaultQueryTimeout = std::chrono::milliseconds(5000);

enum class SessionMode { kPeer, kClient };

// The validated form of the session `Properties`.
struct SessionConfig {
  SessionMode mode = SessionMode::kPeer;
  std::vector<std::string> peers;
  // The endpoint derived from the first peer, empty to use the default.
  std::string endpoint;
  std::vector<std::string> listeners;
  bool multicast_scouting = true;
  // Set when the endpoint was found through `PUBSUB_EMULATOR_HOST`.
  bool emulator = false;
  std::string project_id;
  std::string topic_id = kDefaultTopic;
  std::string subscription_id;
  std::chrono::milliseconds query_timeout = kDefaultQueryTimeout;
  bool library_tracing = true;
};

// Validates the `mode`, `peer`, `listener`, `multicast_scouting`, `project`,
// `topic`, `subscription`, `query_timeout_ms` and `library_tracing` keys.
// Unknown keys are ignored. `project` defaults to `$GOOGLE_CLOUD_PROJECT`.
google::cloud::StatusOr<SessionConfig> ParseSessionConfig(
    Properties const& properties);

// Converts a `tcp/host:port` locator into a gRPC endpoint.
google::cloud::StatusOr<std::string> LocatorToEndpoint(
    std::string const& locator);

// The options for the Pub/Sub publisher and subscriber connections.
google::cloud::Options ConnectionOptions(SessionConfig const& config);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_SESSION_CONFIG_H
