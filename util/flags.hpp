#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Scheduling and storage.
DECLARE_int32(num_cores);
DECLARE_string(temp_directory);

// External tools.
DECLARE_string(javac);
DECLARE_string(java);

// Limits.
DECLARE_int32(compile_timeout_ms);
DECLARE_int32(execution_timeout_ms);
DECLARE_int32(javac_heap_mb);
DECLARE_int32(max_heap_mb);
DECLARE_int32(max_stack_kb);
DECLARE_int32(max_metaspace_mb);
DECLARE_int32(max_output_kb);
DECLARE_int32(max_file_size_kb);
DECLARE_int32(max_source_kb);

// Artifact cache.
DECLARE_int32(cache_entries);
DECLARE_int32(cache_size);
DECLARE_int32(low_memory_mb);

// Memory estimation.
DECLARE_bool(memory_probe);
DECLARE_int32(memory_probe_interval_ms);

#endif
