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

#include "parse_args.h"
#include "path.h"
#include "tracing.h"
#include "value.h"
#include "workspace.h"
#include "google/cloud/log.h"
#include <opentelemetry/trace/scope.h>
#include <iostream>
#include <memory>
#include <sstream>

// Create a few namespace aliases to make the code easier to read.
namespace gc = ::google::cloud;
namespace tw = ::traced_workspace;

int main(int argc, char* argv[]) try {
  tw::ProgramDescription program;
  program.description =
      "traced_get: sends a get after putting its trace context";
  program.service_name = "traced_get";
  program.resource = tw::ProgramDescription::Resource::kSelector;
  program.resource_help = "the selection of resources to get";
  program.default_resource = "/demo/example/**";
  program.with_trace_path = true;
  program.default_trace_path = "/demo/example/eval";

  auto args = tw::ParseArguments(argc, argv, program);
  if (args.help) return 0;
  if (args.verbose) gc::LogSink::EnableStdClog();

  auto selector = tw::Selector::Parse(args.resource).value();
  auto trace_path = tw::Path::Parse(args.trace_path).value();

  auto status = tw::ConfigureTracing(args.tracing);
  if (!status.ok()) throw status;
  // Automatically call `Cleanup()` before returning from `main()`.
  std::shared_ptr<void> cleanup(nullptr, [](void*) { tw::Cleanup(); });

  auto tracer = tw::GetTracer("traced_get");
  auto span = tracer->StartSpan("Root");
  auto scope = tracer->WithActiveSpan(span);

  std::cout << "New session...\n";
  auto session = tw::Session::Open(args.config).value();

  std::cout << "New workspace...\n";
  auto workspace = session.NewWorkspace();

  auto const traceparent = tw::InjectTraceParent(span);
  if (!traceparent.empty()) {
    std::cout << "Put Span Data ('" << traceparent << "')...\n\n";
    status = workspace.Put(trace_path, tw::Value::StringUtf8(traceparent));
    if (!status.ok()) throw status;
  }

  std::cout << "Get Data from '" << selector << "'...\n\n";
  auto replies = workspace.Get(selector).value();
  for (auto data = replies.Next(); data; data = replies.Next()) {
    std::cout << "  " << data->path << " : " << data->value
              << " (encoding: " << data->value.encoding_descr()
              << " , timestamp: " << data->timestamp << ")\n";
    std::ostringstream os;
    os << data->value;
    auto const printed = os.str();
    span->AddEvent("Get the return data", {{"data", printed}});
  }

  span->End();
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
