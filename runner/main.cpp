#include <future>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/dispatcher.hpp"
#include "manager/options.hpp"
#include "manager/pipeline.hpp"
#include "util/file.hpp"

namespace {
// A submission counts as successful if it compiled and, when it had a main
// method, ran successfully.
bool Succeeded(const proto::SubmissionResult& result) {
  return result.compilation_success() && result.execution_success();
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Compiles and runs Java sources in a sandbox.\n"
      "Usage: runbox [flags] [Source.java ...]\n"
      "Reads a single source from standard input if no file is given.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  manager::PipelineOptions options = manager::PipelineOptions::FromFlags();
  manager::Pipeline pipeline(options);

  std::vector<std::pair<std::string, std::string>> sources;
  int exit_code = 0;
  if (argc == 1) {
    std::string source((std::istreambuf_iterator<char>(std::cin)),
                       std::istreambuf_iterator<char>());
    sources.emplace_back("<stdin>", std::move(source));
  }
  for (int i = 1; i < argc; i++) {
    try {
      sources.emplace_back(argv[i], util::File::Read(argv[i]));
    } catch (const std::system_error& e) {
      LOG(ERROR) << "Cannot read " << argv[i] << ": " << e.what();
      exit_code = 1;
    }
  }

  std::vector<std::future<proto::SubmissionResult>> results;
  {
    manager::Dispatcher dispatcher(&pipeline, options.num_cores);
    for (const auto& source : sources) {
      results.push_back(dispatcher.Submit(source.second));
    }
    google::protobuf::util::JsonPrintOptions json_options;
    json_options.always_print_primitive_fields = true;
    json_options.preserve_proto_field_names = true;
    for (size_t i = 0; i < results.size(); i++) {
      proto::SubmissionResult result = results[i].get();
      std::string json;
      auto status = google::protobuf::util::MessageToJsonString(
          result, &json, json_options);
      if (!status.ok()) {
        LOG(ERROR) << "Cannot print the result of " << sources[i].first << ": "
                   << status.ToString();
        exit_code = 1;
        continue;
      }
      VLOG(1) << sources[i].first << " done";
      std::cout << json << std::endl;
      if (!Succeeded(result)) exit_code = 1;
    }
  }
  return exit_code;
}
