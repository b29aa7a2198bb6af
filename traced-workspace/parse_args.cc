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
#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace traced_workspace {

namespace po = ::boost::program_options;

ParseResult ParseArguments(int argc, char const* const argv[],
                           ProgramDescription const& program) {
  po::options_description desc(program.description);
  // The following empty line comments are for readability.
  desc.add_options()
      //
      ("help,h", "produce help message")
      //
      ("verbose,v", "log the client library activity to stderr")
      // Session options
      ("mode,m", po::value<std::string>(),
       "the session mode (peer|client), peer by default")
      //
      ("peer,e", po::value<std::vector<std::string>>()->composing(),
       "peer locators used to initiate the session, e.g. tcp/localhost:8085")
      //
      ("listener,l", po::value<std::vector<std::string>>()->composing(),
       "locators to listen on")
      //
      ("config,c", po::value<std::string>(), "a configuration file")
      //
      ("no-multicast-scouting",
       "disable the discovery of an emulator through PUBSUB_EMULATOR_HOST")
      //
      ("project", po::value<std::string>(),
       "the Google Cloud project, defaults to $GOOGLE_CLOUD_PROJECT")
      //
      ("topic", po::value<std::string>(), "the workspace topic")
      //
      ("subscription", po::value<std::string>(),
       "this program's subscription on the workspace topic")
      // Tracing options
      ("exporter", po::value<std::string>()->default_value("zipkin"),
       "where to export spans (zipkin|cloud-trace|ostream)")
      //
      ("max-queue-size", po::value<int>()->default_value(0),
       "If set to 0, uses the default tracing configuration.")
      //
      ("service-name",
       po::value<std::string>()->default_value(program.service_name),
       "the service name attached to the exported spans");

  if (program.resource == ProgramDescription::Resource::kPath) {
    desc.add_options()("path,p",
                       po::value<std::string>()->default_value(
                           program.default_resource),
                       program.resource_help.c_str());
  } else {
    desc.add_options()("selector,s",
                       po::value<std::string>()->default_value(
                           program.default_resource),
                       program.resource_help.c_str());
  }
  if (program.with_value) {
    desc.add_options()(
        "value", po::value<std::string>()->default_value(program.default_value),
        "the value of the resource to put");
  }
  if (program.with_trace_path) {
    desc.add_options()("trace-path",
                       po::value<std::string>()->default_value(
                           program.default_trace_path),
                       "where to put the trace context before the get");
  }

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);

  ParseResult result;
  if (vm.count("help")) {
    std::cerr << "Usage: " << argv[0] << " [options]\n";
    std::cerr << desc;
    result.help = true;
    return result;
  }

  // This must come before po::notify which raises any errors when parsing the
  // arguments. This ensures if --help is passed, the program does not raise any
  // issues about missing required arguments.
  po::notify(vm);

  if (vm.count("config")) {
    result.config = Properties::FromFile(vm["config"].as<std::string>()).value();
  }
  if (vm.count("mode")) {
    auto const mode = vm["mode"].as<std::string>();
    if (mode != "peer" && mode != "client") {
      throw std::runtime_error("--mode must be one of: peer|client, got " +
                               mode);
    }
    result.config.Set("mode", mode);
  }
  for (std::string key : {"peer", "listener"}) {
    if (!vm.count(key)) continue;
    result.config.Set(key, boost::algorithm::join(
                               vm[key].as<std::vector<std::string>>(), ","));
  }
  if (vm.count("no-multicast-scouting")) {
    result.config.Set("multicast_scouting", "false");
  }
  for (std::string key : {"project", "topic", "subscription"}) {
    if (!vm.count(key)) continue;
    auto value = vm[key].as<std::string>();
    if (value.empty()) {
      throw std::runtime_error("The " + key + " cannot be empty");
    }
    result.config.Set(key, std::move(value));
  }

  result.verbose = vm.count("verbose") != 0;
  result.resource =
      program.resource == ProgramDescription::Resource::kPath
          ? vm["path"].as<std::string>()
          : vm["selector"].as<std::string>();
  if (result.resource.empty()) {
    throw std::runtime_error("The path or selector cannot be empty");
  }
  if (program.with_value) result.value = vm["value"].as<std::string>();
  if (program.with_trace_path) {
    result.trace_path = vm["trace-path"].as<std::string>();
  }

  auto const exporter = vm["exporter"].as<std::string>();
  if (exporter != "zipkin" && exporter != "cloud-trace" &&
      exporter != "ostream") {
    throw std::runtime_error(
        "exporter is invalid. it must be one of the three values: "
        "zipkin|cloud-trace|ostream");
  }
  auto const max_queue_size = vm["max-queue-size"].as<int>();
  if (max_queue_size < 0) {
    throw std::runtime_error("--max-queue-size cannot be negative");
  }
  result.tracing.exporter = exporter;
  result.tracing.service_name = vm["service-name"].as<std::string>();
  result.tracing.max_queue_size = max_queue_size;
  result.tracing.executable_path = argv[0];
  result.tracing.project_id = [&] {
    if (auto p = result.config.Get("project")) return *p;
    auto const* env = std::getenv("GOOGLE_CLOUD_PROJECT");
    return env == nullptr ? std::string{} : std::string(env);
  }();
  return result;
}

}  // namespace traced_workspace
