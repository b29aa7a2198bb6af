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
#include "google/cloud/opentelemetry_options.h"
#include <gmock/gmock.h>
#include <cstdlib>
#include <optional>
#include <string>

namespace traced_workspace {
namespace {

namespace gc = ::google::cloud;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// Sets (or unsets) an environment variable for the lifetime of the object.
class ScopedEnvironment {
 public:
  ScopedEnvironment(std::string name, std::optional<std::string> value)
      : name_(std::move(name)) {
    if (auto const* v = std::getenv(name_.c_str())) previous_ = v;
    Apply(value);
  }
  ~ScopedEnvironment() { Apply(previous_); }

  ScopedEnvironment(ScopedEnvironment const&) = delete;
  ScopedEnvironment& operator=(ScopedEnvironment const&) = delete;

 private:
  void Apply(std::optional<std::string> const& value) {
    if (value) {
      ::setenv(name_.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  std::string name_;
  std::optional<std::string> previous_;
};

class SessionConfigTest : public ::testing::Test {
 protected:
  ScopedEnvironment project_{"GOOGLE_CLOUD_PROJECT", std::nullopt};
  ScopedEnvironment emulator_{"PUBSUB_EMULATOR_HOST", std::nullopt};
};

TEST_F(SessionConfigTest, Defaults) {
  auto config = ParseSessionConfig(Properties::Parse("project=p"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->mode, SessionMode::kPeer);
  EXPECT_THAT(config->peers, IsEmpty());
  EXPECT_TRUE(config->endpoint.empty());
  EXPECT_TRUE(config->multicast_scouting);
  EXPECT_FALSE(config->emulator);
  EXPECT_EQ(config->project_id, "p");
  EXPECT_EQ(config->topic_id, "traced-workspace");
  EXPECT_TRUE(config->subscription_id.empty());
  EXPECT_EQ(config->query_timeout, std::chrono::milliseconds(5000));
  EXPECT_TRUE(config->library_tracing);
}

TEST_F(SessionConfigTest, AllKeys) {
  auto config = ParseSessionConfig(Properties::Parse(
      "mode=client;peer=tcp/localhost:8085,tcp/localhost:8086;"
      "listener=tcp/0.0.0.0:7447;multicast_scouting=false;project=p;"
      "topic=t;subscription=s;query_timeout_ms=250;library_tracing=false"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->mode, SessionMode::kClient);
  EXPECT_THAT(config->peers,
              ElementsAre("tcp/localhost:8085", "tcp/localhost:8086"));
  EXPECT_EQ(config->endpoint, "localhost:8085");
  EXPECT_THAT(config->listeners, ElementsAre("tcp/0.0.0.0:7447"));
  EXPECT_FALSE(config->multicast_scouting);
  EXPECT_EQ(config->topic_id, "t");
  EXPECT_EQ(config->subscription_id, "s");
  EXPECT_EQ(config->query_timeout, std::chrono::milliseconds(250));
  EXPECT_FALSE(config->library_tracing);
}

TEST_F(SessionConfigTest, ProjectFromEnvironment) {
  ScopedEnvironment env("GOOGLE_CLOUD_PROJECT", "env-project");
  auto config = ParseSessionConfig(Properties{});
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->project_id, "env-project");

  config = ParseSessionConfig(Properties::Parse("project=flag-project"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->project_id, "flag-project");
}

TEST_F(SessionConfigTest, MissingProject) {
  auto config = ParseSessionConfig(Properties{});
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.status().code(), gc::StatusCode::kInvalidArgument);
  EXPECT_THAT(config.status().message(), HasSubstr("no project"));
}

TEST_F(SessionConfigTest, InvalidValues) {
  for (auto const* text : {
           "project=p;mode=router",
           "project=p;multicast_scouting=yes",
           "project=p;library_tracing=1",
           "project=p;topic=",
           "project=p;query_timeout_ms=0",
           "project=p;query_timeout_ms=-5",
           "project=p;query_timeout_ms=10s",
           "project=p;peer=udp/localhost:8085",
           "project=p;peer=tcp/",
       }) {
    SCOPED_TRACE("Testing with " + std::string(text));
    auto config = ParseSessionConfig(Properties::Parse(text));
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.status().code(), gc::StatusCode::kInvalidArgument);
  }
}

TEST_F(SessionConfigTest, ClientModeRequiresPeer) {
  auto config = ParseSessionConfig(Properties::Parse("project=p;mode=client"));
  ASSERT_FALSE(config.ok());
  EXPECT_THAT(config.status().message(), HasSubstr("client mode"));
}

TEST_F(SessionConfigTest, ScoutingFindsEmulator) {
  ScopedEnvironment env("PUBSUB_EMULATOR_HOST", "localhost:8681");
  auto config = ParseSessionConfig(Properties::Parse("project=p;mode=client"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->endpoint, "localhost:8681");
  EXPECT_TRUE(config->emulator);
}

TEST_F(SessionConfigTest, ScoutingDisabled) {
  ScopedEnvironment env("PUBSUB_EMULATOR_HOST", "localhost:8681");
  auto config = ParseSessionConfig(
      Properties::Parse("project=p;multicast_scouting=false"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_TRUE(config->endpoint.empty());
  EXPECT_FALSE(config->emulator);
}

TEST_F(SessionConfigTest, PeerWinsOverScouting) {
  ScopedEnvironment env("PUBSUB_EMULATOR_HOST", "localhost:8681");
  auto config =
      ParseSessionConfig(Properties::Parse("project=p;peer=tcp/gateway:443"));
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->endpoint, "gateway:443");
  EXPECT_FALSE(config->emulator);
}

TEST(LocatorToEndpointTest, Basic) {
  EXPECT_EQ(LocatorToEndpoint("tcp/localhost:8085").value(), "localhost:8085");
  EXPECT_EQ(LocatorToEndpoint("localhost:8085").value(), "localhost:8085");
  EXPECT_FALSE(LocatorToEndpoint("udp/localhost:8085").ok());
  EXPECT_FALSE(LocatorToEndpoint("tcp/").ok());
}

TEST(ConnectionOptionsTest, DefaultEndpoint) {
  SessionConfig config;
  auto const options = ConnectionOptions(config);
  EXPECT_FALSE(options.has<gc::EndpointOption>());
  EXPECT_FALSE(options.has<gc::UnifiedCredentialsOption>());
  EXPECT_TRUE(options.get<gc::OpenTelemetryTracingOption>());
}

TEST(ConnectionOptionsTest, ClientMode) {
  SessionConfig config;
  config.mode = SessionMode::kClient;
  config.endpoint = "localhost:8085";
  config.library_tracing = false;
  auto const options = ConnectionOptions(config);
  EXPECT_EQ(options.get<gc::EndpointOption>(), "localhost:8085");
  EXPECT_TRUE(options.has<gc::UnifiedCredentialsOption>());
  EXPECT_FALSE(options.get<gc::OpenTelemetryTracingOption>());
}

TEST(ConnectionOptionsTest, PeerModeWithRemoteEndpoint) {
  SessionConfig config;
  config.endpoint = "pubsub.example.com:443";
  auto const options = ConnectionOptions(config);
  EXPECT_EQ(options.get<gc::EndpointOption>(), "pubsub.example.com:443");
  EXPECT_FALSE(options.has<gc::UnifiedCredentialsOption>());
}

}  // namespace
}  // namespace traced_workspace
