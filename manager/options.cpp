#include "manager/options.hpp"

#include "glog/logging.h"
#include "util/flags.hpp"

namespace manager {

PipelineOptions PipelineOptions::FromFlags() {
  CHECK_GT(FLAGS_compile_timeout_ms, 0) << "--compile_timeout_ms";
  CHECK_GT(FLAGS_execution_timeout_ms, 0) << "--execution_timeout_ms";
  CHECK_GT(FLAGS_max_heap_mb, 0) << "--max_heap_mb";
  CHECK_GT(FLAGS_max_source_kb, 0) << "--max_source_kb";
  CHECK_GE(FLAGS_cache_entries, 0) << "--cache_entries";
  CHECK_GE(FLAGS_cache_size, 0) << "--cache_size";
  CHECK_GE(FLAGS_num_cores, 0) << "--num_cores";

  PipelineOptions options;
  options.temp_directory = FLAGS_temp_directory;
  options.javac = FLAGS_javac;
  options.java = FLAGS_java;
  options.compile_timeout_ms = FLAGS_compile_timeout_ms;
  options.execution_timeout_ms = FLAGS_execution_timeout_ms;
  options.javac_heap_mb = FLAGS_javac_heap_mb;
  options.max_heap_mb = FLAGS_max_heap_mb;
  options.max_stack_kb = FLAGS_max_stack_kb;
  options.max_metaspace_mb = FLAGS_max_metaspace_mb;
  options.max_output_kb = FLAGS_max_output_kb;
  options.max_file_size_kb = FLAGS_max_file_size_kb;
  options.max_source_kb = FLAGS_max_source_kb;
  options.cache_entries = FLAGS_cache_entries;
  options.cache_size_mb = FLAGS_cache_size;
  options.low_memory_mb = FLAGS_low_memory_mb;
  options.memory_probe = FLAGS_memory_probe;
  options.memory_probe_interval_ms = FLAGS_memory_probe_interval_ms;
  options.num_cores = FLAGS_num_cores;
  return options;
}

}  // namespace manager
