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

#ifndef TRACED_WORKSPACE_MESSAGE_CODEC_H
#define TRACED_WORKSPACE_MESSAGE_CODEC_H

#include "change.h"
#include "path.h"
#include "google/cloud/pubsub/message.h"
#include "google/cloud/status_or.h"
#include <string>
#include <variant>

namespace traced_workspace {

// Pub/Sub attribute names used to carry workspace operations. The value
// payload, if any, is the message data.
inline auto constexpr kKindAttribute = "tw-kind";
inline auto constexpr kPathAttribute = "tw-path";
inline auto constexpr kSelectorAttribute = "tw-selector";
inline auto constexpr kQueryIdAttribute = "tw-query-id";
inline auto constexpr kEncodingAttribute = "tw-encoding";
inline auto constexpr kTimestampAttribute = "tw-timestamp";
inline auto constexpr kSourceAttribute = "tw-source";

struct QueryMessage {
  Selector selector;
  std::string query_id;
  Timestamp timestamp;
};

struct ReplyMessage {
  std::string query_id;
  Data data;
};

using WorkspaceMessage = std::variant<Change, QueryMessage, ReplyMessage>;

google::cloud::pubsub::Message EncodeChange(Change const& change);
google::cloud::pubsub::Message EncodeQuery(QueryMessage const& query);
google::cloud::pubsub::Message EncodeReply(ReplyMessage const& reply);

// Returns `kInvalidArgument` for messages that were not produced by a
// workspace, or that are missing required attributes.
google::cloud::StatusOr<WorkspaceMessage> DecodeMessage(
    google::cloud::pubsub::Message const& message);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_MESSAGE_CODEC_H
