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

#include "console.h"
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace traced_workspace {

bool QuitWatcher::QuitRequested(std::chrono::milliseconds timeout) {
  if (quit_) return true;
  if (eof_) return false;
  pollfd pfd{fd_, POLLIN, 0};
  auto const ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready <= 0) return false;
  char buffer[64];
  auto const n = ::read(fd_, buffer, sizeof(buffer));
  if (n < 0 && errno == EINTR) return false;
  if (n <= 0) {
    eof_ = true;
    return false;
  }
  for (ssize_t i = 0; i < n; ++i) {
    if (buffer[i] == 'q') quit_ = true;
  }
  return quit_;
}

}  // namespace traced_workspace
