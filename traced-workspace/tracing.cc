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

#include "tracing.h"
#include "google/cloud/log.h"
#include "google/cloud/opentelemetry/trace_exporter.h"
#include "google/cloud/project.h"
#include <fmt/format.h>
#include <opentelemetry/context/propagation/global_propagator.h>
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/ostream/span_exporter_factory.h>
#include <opentelemetry/exporters/zipkin/zipkin_exporter_factory.h>
#include <opentelemetry/exporters/zipkin/zipkin_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/provider.h>
#include <unistd.h>
#include <cstdint>
#include <map>

namespace traced_workspace {

// Create a few namespace aliases to make the code easier to read.
namespace gc = ::google::cloud;
namespace otel = gc::otel;
namespace nostd = ::opentelemetry::nostd;
namespace propagation = ::opentelemetry::context::propagation;
namespace resource = ::opentelemetry::sdk::resource;
namespace trace_sdk = ::opentelemetry::sdk::trace;
namespace trace = ::opentelemetry::trace;
namespace zipkin = ::opentelemetry::exporter::zipkin;

namespace {

// A single-header carrier. The propagator only ever reads and writes the
// `traceparent` and `tracestate` keys.
class HeaderCarrier : public propagation::TextMapCarrier {
 public:
  HeaderCarrier() = default;
  explicit HeaderCarrier(std::string traceparent) {
    headers_[kTraceParentHeader] = std::move(traceparent);
  }

  nostd::string_view Get(nostd::string_view key) const noexcept override {
    auto i = headers_.find(std::string(key));
    if (i == headers_.end()) return "";
    return i->second;
  }

  void Set(nostd::string_view key, nostd::string_view value) noexcept override {
    headers_[std::string(key)] = std::string(value);
  }

  std::string TraceParent() const {
    auto i = headers_.find(kTraceParentHeader);
    if (i == headers_.end()) return std::string{};
    return i->second;
  }

 private:
  std::map<std::string, std::string> headers_;
};

gc::StatusOr<std::unique_ptr<trace_sdk::SpanExporter>> MakeExporter(
    TracingConfig const& config) {
  if (config.exporter == "zipkin") {
    zipkin::ZipkinExporterOptions options;
    options.service_name = config.service_name;
    GCP_LOG(INFO) << "Exporting spans to zipkin collector at "
                  << options.endpoint;
    return zipkin::ZipkinExporterFactory::Create(options);
  }
  if (config.exporter == "cloud-trace") {
    if (config.project_id.empty()) {
      return gc::Status(gc::StatusCode::kInvalidArgument,
                        "the cloud-trace exporter requires a project id");
    }
    return otel::MakeTraceExporter(gc::Project(config.project_id));
  }
  if (config.exporter == "ostream") {
    return opentelemetry::exporter::trace::OStreamSpanExporterFactory::Create();
  }
  return gc::Status(
      gc::StatusCode::kInvalidArgument,
      fmt::format("unknown exporter <{}>, expected zipkin|cloud-trace|ostream",
                  config.exporter));
}

resource::Resource MakeResource(TracingConfig const& config) {
  resource::ResourceAttributes attributes;
  attributes.SetAttribute("service.name", config.service_name);
  attributes.SetAttribute("service.version", TRACED_WORKSPACE_VERSION);
  if (!config.executable_path.empty()) {
    attributes.SetAttribute("process.executable.path",
                            config.executable_path);
  }
  attributes.SetAttribute("process.pid", static_cast<std::int64_t>(getpid()));
  return resource::Resource::Create(attributes);
}

}  // namespace

gc::Status ConfigureTracing(TracingConfig const& config) {
  auto exporter = MakeExporter(config);
  if (!exporter) return std::move(exporter).status();
  InstallTracerProvider(*std::move(exporter), config);
  return gc::Status{};
}

void InstallTracerProvider(std::unique_ptr<trace_sdk::SpanExporter> exporter,
                           TracingConfig const& config) {
  propagation::GlobalTextMapPropagator::SetGlobalPropagator(
      nostd::shared_ptr<propagation::TextMapPropagator>(
          new trace::propagation::HttpTraceContext()));

  trace_sdk::BatchSpanProcessorOptions span_options;
  if (config.max_queue_size > 0) {
    span_options.max_queue_size = config.max_queue_size;
  }
  auto processor = trace_sdk::BatchSpanProcessorFactory::Create(
      std::move(exporter), span_options);
  auto provider = trace_sdk::TracerProviderFactory::Create(
      std::move(processor), MakeResource(config));
  trace::Provider::SetTracerProvider(std::move(provider));
}

void Cleanup() {
  auto provider = trace::Provider::GetTracerProvider();
  if (auto* sdk = dynamic_cast<trace_sdk::TracerProvider*>(provider.get())) {
    sdk->ForceFlush();
  }

  std::shared_ptr<trace::TracerProvider> none;
  trace::Provider::SetTracerProvider(none);
}

nostd::shared_ptr<trace::Tracer> GetTracer(std::string const& name) {
  return trace::Provider::GetTracerProvider()->GetTracer(
      name, TRACED_WORKSPACE_VERSION);
}

std::string InjectTraceParent(nostd::shared_ptr<trace::Span> const& span) {
  if (!span->GetContext().IsValid()) return std::string{};
  auto context = trace::SetSpan(
      opentelemetry::context::RuntimeContext::GetCurrent(), span);
  HeaderCarrier carrier;
  auto propagator = propagation::GlobalTextMapPropagator::GetGlobalPropagator();
  propagator->Inject(carrier, context);
  return carrier.TraceParent();
}

opentelemetry::context::Context ExtractContext(std::string const& traceparent) {
  HeaderCarrier carrier(traceparent);
  auto propagator = propagation::GlobalTextMapPropagator::GetGlobalPropagator();
  auto current = opentelemetry::context::RuntimeContext::GetCurrent();
  return propagator->Extract(carrier, current);
}

}  // namespace traced_workspace
