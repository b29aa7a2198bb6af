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

#include "session_config.h"
#include "google/cloud/common_options.h"
#include "google/cloud/credentials.h"
#include "google/cloud/log.h"
#include "google/cloud/opentelemetry_options.h"
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>

namespace traced_workspace {

namespace gc = ::google::cloud;

namespace {

gc::Status InvalidArgument(std::string message) {
  return gc::Status(gc::StatusCode::kInvalidArgument, std::move(message));
}

std::vector<std::string> SplitList(std::string const& value) {
  std::vector<std::string> result;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto const end = value.find(',', start);
    auto item = value.substr(start, end == std::string::npos ? end : end - start);
    if (!item.empty()) result.push_back(std::move(item));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return result;
}

gc::StatusOr<bool> ParseBool(std::string const& key, std::string const& value) {
  if (value == "true") return true;
  if (value == "false") return false;
  return InvalidArgument(
      fmt::format("{} must be `true` or `false`, got <{}>", key, value));
}

}  // namespace

gc::StatusOr<std::string> LocatorToEndpoint(std::string const& locator) {
  auto const slash = locator.find('/');
  if (slash == std::string::npos) return locator;
  auto const protocol = locator.substr(0, slash);
  if (protocol != "tcp") {
    return InvalidArgument(fmt::format(
        "unsupported locator <{}>, only tcp/<host>:<port> is supported",
        locator));
  }
  auto endpoint = locator.substr(slash + 1);
  if (endpoint.empty()) {
    return InvalidArgument(fmt::format("empty address in <{}>", locator));
  }
  return endpoint;
}

gc::StatusOr<SessionConfig> ParseSessionConfig(Properties const& properties) {
  SessionConfig config;

  auto const mode = properties.GetOr("mode", "peer");
  if (mode == "peer") {
    config.mode = SessionMode::kPeer;
  } else if (mode == "client") {
    config.mode = SessionMode::kClient;
  } else {
    return InvalidArgument(
        fmt::format("mode must be `peer` or `client`, got <{}>", mode));
  }

  config.peers = SplitList(properties.GetOr("peer", ""));
  config.listeners = SplitList(properties.GetOr("listener", ""));
  if (!config.peers.empty()) {
    auto endpoint = LocatorToEndpoint(config.peers.front());
    if (!endpoint) return std::move(endpoint).status();
    config.endpoint = *std::move(endpoint);
  }
  for (auto const& l : config.listeners) {
    GCP_LOG(INFO) << "listener " << l
                  << " is not used by the Pub/Sub transport";
  }

  auto scouting =
      ParseBool("multicast_scouting", properties.GetOr("multicast_scouting",
                                                       "true"));
  if (!scouting) return std::move(scouting).status();
  config.multicast_scouting = *scouting;
  if (config.endpoint.empty() && config.multicast_scouting) {
    auto const* emulator = std::getenv("PUBSUB_EMULATOR_HOST");
    if (emulator != nullptr && *emulator != '\0') {
      GCP_LOG(INFO) << "using the Pub/Sub emulator found at " << emulator;
      config.endpoint = emulator;
      config.emulator = true;
    }
  }
  if (config.mode == SessionMode::kClient && config.endpoint.empty()) {
    return InvalidArgument(
        "client mode requires a peer locator or a scouted emulator");
  }

  auto tracing =
      ParseBool("library_tracing", properties.GetOr("library_tracing", "true"));
  if (!tracing) return std::move(tracing).status();
  config.library_tracing = *tracing;

  config.project_id = [&] {
    if (auto p = properties.Get("project")) return *p;
    auto const* env = std::getenv("GOOGLE_CLOUD_PROJECT");
    return env == nullptr ? std::string{} : std::string(env);
  }();
  if (config.project_id.empty()) {
    return InvalidArgument(
        "no project configured, set `project` or GOOGLE_CLOUD_PROJECT");
  }
  config.topic_id = properties.GetOr("topic", kDefaultTopic);
  if (config.topic_id.empty()) {
    return InvalidArgument("the topic cannot be empty");
  }
  config.subscription_id = properties.GetOr("subscription", "");

  if (auto timeout = properties.Get("query_timeout_ms")) {
    errno = 0;
    char* end = nullptr;
    auto const ms = std::strtol(timeout->c_str(), &end, 10);
    if (errno != 0 || timeout->empty() ||
        end != timeout->c_str() + timeout->size() || ms <= 0) {
      return InvalidArgument(fmt::format(
          "query_timeout_ms must be a positive integer, got <{}>", *timeout));
    }
    config.query_timeout = std::chrono::milliseconds(ms);
  }
  return config;
}

gc::Options ConnectionOptions(SessionConfig const& config) {
  auto options =
      gc::Options{}.set<gc::OpenTelemetryTracingOption>(config.library_tracing);
  if (config.endpoint.empty()) return options;
  options.set<gc::EndpointOption>(config.endpoint);
  // Client mode talks to a local gateway or emulator.
  if (config.mode == SessionMode::kClient || config.emulator) {
    options.set<gc::UnifiedCredentialsOption>(gc::MakeInsecureCredentials());
  }
  return options;
}

}  // namespace traced_workspace
