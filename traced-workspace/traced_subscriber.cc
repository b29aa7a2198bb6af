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
#include "parse_args.h"
#include "path.h"
#include "tracing.h"
#include "workspace.h"
#include "google/cloud/log.h"
#include <opentelemetry/trace/span_startoptions.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

// Create a few namespace aliases to make the code easier to read.
namespace gc = ::google::cloud;
namespace trace = ::opentelemetry::trace;
namespace tw = ::traced_workspace;

int main(int argc, char* argv[]) try {
  tw::ProgramDescription program;
  program.description =
      "traced_subscriber: records a span for each change of a selector";
  program.service_name = "traced_subscriber";
  program.resource = tw::ProgramDescription::Resource::kSelector;
  program.resource_help = "the selector to subscribe to";
  program.default_resource = "/demo/example/**";

  auto args = tw::ParseArguments(argc, argv, program);
  if (args.help) return 0;
  if (args.verbose) gc::LogSink::EnableStdClog();

  auto selector = tw::Selector::Parse(args.resource).value();

  auto status = tw::ConfigureTracing(args.tracing);
  if (!status.ok()) throw status;
  // Automatically call `Cleanup()` before returning from `main()`.
  std::shared_ptr<void> cleanup(nullptr, [](void*) { tw::Cleanup(); });

  std::cout << "New session...\n";
  auto session = tw::Session::Open(args.config).value();

  std::cout << "New workspace...\n";
  auto workspace = session.NewWorkspace();

  std::cout << "Subscribe to '" << selector << "'...\n\n";
  auto changes = workspace.Subscribe(selector).value();

  auto tracer = tw::GetTracer("traced_subscriber");
  tw::QuitWatcher quit;
  while (!quit.QuitRequested(std::chrono::milliseconds(0))) {
    auto change = changes.Next(std::chrono::milliseconds(100));
    if (!change) {
      if (changes.closed()) break;
      continue;
    }
    auto value = change->value ? change->value->AsString() : std::nullopt;
    auto const text = value.value_or("other data type");

    trace::StartSpanOptions options;
    options.parent = tw::ExtractContext(text);
    auto span = tracer->StartSpan("Get and process data",
                                  {{"messaging.system", "gcp_pubsub"},
                                   {"messaging.operation", "receive"}},
                                  options);
    span->AddEvent("Start process data");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    span->AddEvent("Finish process");
    span->End();

    std::cout << ">> [Subscription listener] received " << change->kind
              << " for " << change->path << " : " << std::quoted(text)
              << " with timestamp " << change->timestamp << "\n";
  }

  changes.Close();
  status = session.Close();
  if (!status.ok()) throw status;

  return 0;
} catch (google::cloud::Status const& status) {
  std::cerr << "google::cloud::Status thrown: " << status << "\n";
  return 1;
} catch (std::exception const& ex) {
  std::cerr << "Standard C++ exception thrown: " << ex.what() << "\n";
  return 1;
}
