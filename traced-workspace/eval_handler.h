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

#ifndef TRACED_WORKSPACE_EVAL_HANDLER_H
#define TRACED_WORKSPACE_EVAL_HANDLER_H

#include "path.h"
#include "workspace.h"
#include <ostream>
#include <string>

namespace traced_workspace {

inline auto constexpr kDefaultEvalName = "C++!";

// Finds the name to use in the reply to a get, based on the `name` property
// of its selector:
// - `/demo/example/eval`: no property, `kDefaultEvalName` is used
// - `/demo/example/eval?(name=Bob)`: `Bob` is used
// - `/demo/example/eval?(name=/demo/example/name)`: the eval does a get on
//   `/demo/example/name` and uses the first string value it receives
//
// Problems resolving a name are reported on `log`, and the literal property
// value is used instead.
std::string ResolveEvalName(Workspace& workspace, Selector const& selector,
                            std::ostream& log);

std::string EvalReply(std::string const& name);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_EVAL_HANDLER_H
