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

#ifndef TRACED_WORKSPACE_TRACING_H
#define TRACED_WORKSPACE_TRACING_H

#include "google/cloud/status.h"
#include <opentelemetry/context/context.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/exporter.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <memory>
#include <string>

namespace traced_workspace {

inline auto constexpr kTraceParentHeader = "traceparent";

struct TracingConfig {
  // One of `zipkin`, `cloud-trace` or `ostream`.
  std::string exporter = "zipkin";
  std::string service_name;
  // Only used by the `cloud-trace` exporter.
  std::string project_id;
  // If set to 0, uses the default batch span processor configuration.
  int max_queue_size = 0;
  std::string executable_path;
};

// Installs the W3C trace-context propagator and a tracer provider exporting
// spans in batches with the exporter named in `config`.
//
// The zipkin exporter sends spans to `OTEL_EXPORTER_ZIPKIN_ENDPOINT`, or to
// `http://localhost:9411/api/v2/spans` if that variable is not set.
google::cloud::Status ConfigureTracing(TracingConfig const& config);

// Same as `ConfigureTracing()`, with a caller supplied exporter.
void InstallTracerProvider(
    std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> exporter,
    TracingConfig const& config);

// Wait for the traces to be exported before exiting the program.
void Cleanup();

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer(
    std::string const& name);

// Returns the `traceparent` header for `span`, or an empty string if the
// span context is not valid.
std::string InjectTraceParent(
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> const& span);

// Returns a context holding the remote span described by `traceparent`. The
// span context of the result is invalid if the header cannot be parsed.
opentelemetry::context::Context ExtractContext(std::string const& traceparent);

}  // namespace traced_workspace

#endif  // TRACED_WORKSPACE_TRACING_H
