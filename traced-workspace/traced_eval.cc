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
#include "parse_args.h"
#include "path.h"
#include "tracing.h"
#include "value.h"
#include "workspace.h"
#include "google/cloud/log.h"
#include <opentelemetry/trace/scope.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

// Create a few namespace aliases to make the code easier to read.
namespace gc = ::google::cloud;
namespace trace = ::opentelemetry::trace;
namespace tw = ::traced_workspace;

int main(int argc, char* argv[]) try {
  tw::ProgramDescription program;
  program.description =
      "traced_eval: answers gets, traced under the context put on its path";
  program.service_name = "traced_eval";
  program.resource = tw::ProgramDescription::Resource::kPath;
  program.resource_help = "the path of the eval";
  program.default_resource = "/demo/example/eval";

  auto args = tw::ParseArguments(argc, argv, program);
  if (args.help) return 0;
  if (args.verbose) gc::LogSink::EnableStdClog();

  // The eval is registered on a path, and replies with this same path.
  auto path = tw::Path::Parse(args.resource).value();

  auto status = tw::ConfigureTracing(args.tracing);
  if (!status.ok()) throw status;
  // Automatically call `Cleanup()` before returning from `main()`.
  std::shared_ptr<void> cleanup(nullptr, [](void*) { tw::Cleanup(); });

  std::cout << "New session...\n";
  auto session = tw::Session::Open(args.config).value();

  std::cout << "New workspace...\n";
  auto workspace = session.NewWorkspace();

  auto requests = workspace.RegisterEval(path).value();

  std::cout << "Subscribe to '" << path << "'...\n\n";
  auto changes = workspace.Subscribe(tw::Selector(tw::PathExpr(path))).value();

  // The getter puts its trace context on our path before sending the get.
  auto change = changes.Next();
  // Only the first change is used, later puts must not queue up.
  changes.Close();
  if (!change) {
    throw std::runtime_error("the subscription ended before any change");
  }
  std::cout << ">> [Subscription listener] received " << change->kind
            << " for " << change->path << " : ";
  if (change->value) {
    std::cout << *change->value;
  } else {
    std::cout << "None";
  }
  std::cout << " with timestamp " << change->timestamp << "\n";
  auto const traceparent =
      change->value ? change->value->AsString().value_or("") : "";

  std::cout << "Register eval for '" << path << "'...\n\n";
  auto tracer = tw::GetTracer("traced_eval");
  for (auto request = requests.Next(); request; request = requests.Next()) {
    trace::StartSpanOptions options;
    options.parent = tw::ExtractContext(traceparent);
    auto span = tracer->StartSpan("Request time", options);
    auto scope = tracer->WithActiveSpan(span);
    std::this_thread::sleep_for(std::chrono::seconds(1));
    std::cout << ">> [Eval listener] received get with selector: "
              << request->selector() << "\n";

    auto const name =
        tw::ResolveEvalName(workspace, request->selector(), std::cout);
    auto const reply = tw::EvalReply(name);
    std::cout << "   >> Returning string: \"" << reply << "\"\n";
    status = request->Reply(path, tw::Value::StringUtf8(reply));
    if (!status.ok()) {
      GCP_LOG(WARNING) << "cannot reply to " << request->selector() << ": "
                       << status;
    }
    span->End();
  }

  requests.Close();
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
