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

#ifndef TRACED_WORKSPACE_CONSOLE_H
#define TRACED_WORKSPACE_CONSOLE_H

#include <chrono>

namespace traced_workspace {

// Watches a file descriptor (stdin by default) for a `q` keypress.
class QuitWatcher {
 public:
  explicit QuitWatcher(int fd = 0) : fd_(fd) {}

  // Waits up to `timeout` for input. Returns true once `q` has been read.
  // After end-of-file the watcher stops reading and never reports a quit.
  bool QuitRequested(std::chrono::milliseconds timeout);

  bool eof() const { return eof_; }

 private:
  int fd_;
  bool eof_ = false;
  bool quit_ = false;
};

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_CONSOLE_H
