#ifndef MANAGER_OPTIONS_HPP
#define MANAGER_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace manager {

// Settings of the compile-and-run pipeline. Times are in milliseconds.
struct PipelineOptions {
  // Where workspaces are created. Empty means the system temporary directory.
  std::string temp_directory = "";

  // Compiler and runtime binaries, either paths or names looked up in $PATH.
  std::string javac = "javac";
  std::string java = "java";

  int64_t compile_timeout_ms = 10000;
  int64_t execution_timeout_ms = 10000;
  int32_t javac_heap_mb = 512;
  int32_t max_heap_mb = 256;
  int32_t max_stack_kb = 1024;
  int32_t max_metaspace_mb = 64;
  int64_t max_output_kb = 1024;
  int64_t max_file_size_kb = 16384;
  int64_t max_source_kb = 500;

  size_t cache_entries = 100;
  size_t cache_size_mb = 64;
  int64_t low_memory_mb = 0;

  bool memory_probe = true;
  int32_t memory_probe_interval_ms = 5;

  // Worker threads of the Dispatcher, 0 means one per core.
  int32_t num_cores = 0;

  // Builds the options from the command line flags.
  static PipelineOptions FromFlags();
};

}  // namespace manager

#endif
