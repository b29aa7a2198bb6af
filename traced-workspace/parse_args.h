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

#ifndef TRACED_WORKSPACE_PARSE_ARGS_H
#define TRACED_WORKSPACE_PARSE_ARGS_H

#include "properties.h"
#include "tracing.h"
#include <string>

namespace traced_workspace {

// Describes the flags specific to each program.
struct ProgramDescription {
  enum class Resource { kPath, kSelector };

  std::string description;
  std::string service_name;
  Resource resource = Resource::kSelector;
  std::string resource_help;
  std::string default_resource;
  // Only `sensor` takes a `--value`.
  bool with_value = false;
  std::string default_value;
  // Only `traced_get` takes a `--trace-path`.
  bool with_trace_path = false;
  std::string default_trace_path;
};

// Parse the command line arguments.
struct ParseResult {
  // Set if `--help` was given, the rest of the fields are not.
  bool help = false;
  bool verbose = false;

  // The session configuration, `--config` file entries overridden by flags.
  Properties config;
  // The `--path` or `--selector` value.
  std::string resource;
  std::string value;
  std::string trace_path;

  TracingConfig tracing;
};

// Throws `std::exception` on invalid arguments.
ParseResult ParseArguments(int argc, char const* const argv[],
                           ProgramDescription const& program);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_PARSE_ARGS_H
