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

// Create a few namespace aliases to make the code easier to read.
namespace gc = ::google::cloud;
namespace tw = ::traced_workspace;

int main(int argc, char* argv[]) try {
  tw::ProgramDescription program;
  program.description = "sensor: puts a value carrying its trace context";
  program.service_name = "sensor";
  program.resource = tw::ProgramDescription::Resource::kPath;
  program.resource_help = "the path where to put the value";
  program.default_resource = "/demo/example/zenoh-cpp-put";
  program.with_value = true;
  program.default_value = "Put from C++!";

  auto args = tw::ParseArguments(argc, argv, program);
  if (args.help) return 0;
  if (args.verbose) gc::LogSink::EnableStdClog();

  auto path = tw::Path::Parse(args.resource).value();

  auto status = tw::ConfigureTracing(args.tracing);
  if (!status.ok()) throw status;
  // Automatically call `Cleanup()` before returning from `main()`.
  std::shared_ptr<void> cleanup(nullptr, [](void*) { tw::Cleanup(); });

  auto tracer = tw::GetTracer("sensor");
  auto span = tracer->StartSpan("Put data");
  auto scope = tracer->WithActiveSpan(span);
  span->SetAttribute("sensor.value", args.value);

  std::cout << "New session...\n";
  auto session = tw::Session::Open(args.config).value();

  std::cout << "New workspace...\n";
  auto workspace = session.NewWorkspace();

  auto const traceparent = tw::InjectTraceParent(span);
  std::cout << "Put Data ('" << path << "': '" << traceparent << "')...\n\n";
  status = workspace.Put(path, tw::Value::StringUtf8(traceparent));
  if (!status.ok()) throw status;

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
