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

#include "message_codec.h"
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>
#include <map>
#include <utility>
#include <vector>

namespace traced_workspace {

namespace gc = ::google::cloud;
namespace pubsub = ::google::cloud::pubsub;

namespace {

using Attributes = std::vector<std::pair<std::string, std::string>>;

std::string EncodeTime(std::chrono::system_clock::time_point tp) {
  auto const ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
      tp.time_since_epoch());
  return std::to_string(ns.count());
}

void AppendTimestamp(Attributes& attributes, Timestamp const& ts) {
  attributes.emplace_back(kTimestampAttribute, EncodeTime(ts.time));
  attributes.emplace_back(kSourceAttribute, ts.source);
}

gc::Status Malformed(std::string const& id, std::string const& reason) {
  return gc::Status(
      gc::StatusCode::kInvalidArgument,
      fmt::format("message <{}> is not a workspace message: {}", id, reason));
}

class AttributeReader {
 public:
  explicit AttributeReader(pubsub::Message const& m)
      : id_(m.message_id()), attributes_(m.attributes()) {}

  gc::StatusOr<std::string> Required(char const* name) const {
    auto i = attributes_.find(name);
    if (i == attributes_.end()) {
      return Malformed(id_, fmt::format("missing attribute {}", name));
    }
    return i->second;
  }

  std::string Optional(char const* name) const {
    auto i = attributes_.find(name);
    if (i == attributes_.end()) return std::string{};
    return i->second;
  }

  gc::StatusOr<Timestamp> ReadTimestamp() const {
    auto encoded = Required(kTimestampAttribute);
    if (!encoded) return std::move(encoded).status();
    errno = 0;
    char* end = nullptr;
    auto const ns = std::strtoll(encoded->c_str(), &end, 10);
    if (errno != 0 || encoded->empty() ||
        end != encoded->c_str() + encoded->size()) {
      return Malformed(id_, fmt::format("invalid timestamp <{}>", *encoded));
    }
    auto const since_epoch =
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(ns));
    return Timestamp{std::chrono::system_clock::time_point(since_epoch),
                     Optional(kSourceAttribute)};
  }

  gc::StatusOr<Path> ReadPath() const {
    auto path = Required(kPathAttribute);
    if (!path) return std::move(path).status();
    return Path::Parse(*std::move(path));
  }

  std::string const& id() const { return id_; }

 private:
  std::string id_;
  std::map<std::string, std::string> attributes_;
};

gc::StatusOr<WorkspaceMessage> DecodeChange(AttributeReader const& reader,
                                            ChangeKind kind,
                                            pubsub::Message const& message) {
  auto path = reader.ReadPath();
  if (!path) return std::move(path).status();
  auto timestamp = reader.ReadTimestamp();
  if (!timestamp) return std::move(timestamp).status();
  std::optional<Value> value;
  if (kind != ChangeKind::kDelete) {
    auto v = Value::Decode(reader.Optional(kEncodingAttribute),
                           std::string(message.data()));
    if (!v) return std::move(v).status();
    value = *std::move(v);
  }
  return WorkspaceMessage(Change{*std::move(path), kind, std::move(value),
                                 *std::move(timestamp)});
}

}  // namespace

pubsub::Message EncodeChange(Change const& change) {
  Attributes attributes;
  attributes.emplace_back(kKindAttribute, [&] {
    switch (change.kind) {
      case ChangeKind::kPut:
        return "put";
      case ChangeKind::kPatch:
        return "patch";
      case ChangeKind::kDelete:
        break;
    }
    return "delete";
  }());
  attributes.emplace_back(kPathAttribute, change.path.str());
  AppendTimestamp(attributes, change.timestamp);
  std::string data;
  if (change.value) {
    attributes.emplace_back(kEncodingAttribute, change.value->encoding_descr());
    data = change.value->payload();
  }
  return pubsub::MessageBuilder()
      .SetData(std::move(data))
      .SetAttributes(std::move(attributes))
      .Build();
}

pubsub::Message EncodeQuery(QueryMessage const& query) {
  Attributes attributes{
      {kKindAttribute, "query"},
      {kSelectorAttribute, query.selector.ToString()},
      {kQueryIdAttribute, query.query_id},
  };
  AppendTimestamp(attributes, query.timestamp);
  return pubsub::MessageBuilder().SetAttributes(std::move(attributes)).Build();
}

pubsub::Message EncodeReply(ReplyMessage const& reply) {
  Attributes attributes{
      {kKindAttribute, "reply"},
      {kQueryIdAttribute, reply.query_id},
      {kPathAttribute, reply.data.path.str()},
      {kEncodingAttribute, reply.data.value.encoding_descr()},
  };
  AppendTimestamp(attributes, reply.data.timestamp);
  return pubsub::MessageBuilder()
      .SetData(reply.data.value.payload())
      .SetAttributes(std::move(attributes))
      .Build();
}

gc::StatusOr<WorkspaceMessage> DecodeMessage(pubsub::Message const& message) {
  AttributeReader reader(message);
  auto kind = reader.Required(kKindAttribute);
  if (!kind) return std::move(kind).status();

  if (*kind == "put") return DecodeChange(reader, ChangeKind::kPut, message);
  if (*kind == "patch") {
    return DecodeChange(reader, ChangeKind::kPatch, message);
  }
  if (*kind == "delete") {
    return DecodeChange(reader, ChangeKind::kDelete, message);
  }
  if (*kind == "query") {
    auto selector = reader.Required(kSelectorAttribute);
    if (!selector) return std::move(selector).status();
    auto parsed = Selector::Parse(*selector);
    if (!parsed) return std::move(parsed).status();
    auto query_id = reader.Required(kQueryIdAttribute);
    if (!query_id) return std::move(query_id).status();
    auto timestamp = reader.ReadTimestamp();
    if (!timestamp) return std::move(timestamp).status();
    return WorkspaceMessage(QueryMessage{
        *std::move(parsed), *std::move(query_id), *std::move(timestamp)});
  }
  if (*kind == "reply") {
    auto query_id = reader.Required(kQueryIdAttribute);
    if (!query_id) return std::move(query_id).status();
    auto path = reader.ReadPath();
    if (!path) return std::move(path).status();
    auto timestamp = reader.ReadTimestamp();
    if (!timestamp) return std::move(timestamp).status();
    auto value = Value::Decode(reader.Optional(kEncodingAttribute),
                               std::string(message.data()));
    if (!value) return std::move(value).status();
    return WorkspaceMessage(ReplyMessage{
        *std::move(query_id),
        Data{*std::move(path), *std::move(value), *std::move(timestamp)}});
  }
  return Malformed(reader.id(), fmt::format("unknown kind <{}>", *kind));
}

}  // namespace traced_workspace
