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

#include "eval_handler.h"

namespace traced_workspace {

std::string ResolveEvalName(Workspace& workspace, Selector const& selector,
                            std::ostream& log) {
  auto name = selector.properties().GetOr("name", kDefaultEvalName);
  if (name.empty() || name.front() != '/') return name;

  log << "   >> Get name to use from path: " << name << "\n";
  auto name_selector = Selector::Parse(name);
  if (!name_selector) {
    log << "Failed to get value from '" << name
        << "' : this is not a valid Selector\n";
    return name;
  }
  auto stream = workspace.Get(*name_selector);
  if (!stream) {
    log << "Failed to get name from '" << name << "' : " << stream.status()
        << "\n";
    return name;
  }
  auto data = stream->Next();
  if (!data) {
    log << "Failed to get name from '" << name << "' : not found\n";
    return name;
  }
  auto s = data->value.AsString();
  if (!s) {
    log << "Failed to get name from '" << name
        << "' : not a UTF-8 String\n";
    return name;
  }
  return *s;
}

std::string EvalReply(std::string const& name) { return "Eval from " + name; }

}  // namespace traced_workspace
