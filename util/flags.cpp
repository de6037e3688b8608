#include "util/flags.hpp"

DEFINE_int32(
    num_cores, 0,
    "Number of submissions processed in parallel. If unset, autodetect");
DEFINE_string(temp_directory, "",
              "Where the workspaces should be created. If unset, use $TMPDIR "
              "or /tmp");

DEFINE_string(javac, "javac", "Java compiler, looked up in PATH unless it contains a slash");
DEFINE_string(java, "java", "Java runtime, looked up in PATH unless it contains a slash");

DEFINE_int32(compile_timeout_ms, 10000, "Wall time limit for the compiler");
DEFINE_int32(execution_timeout_ms, 10000, "Wall time limit for the program");
DEFINE_int32(javac_heap_mb, 512, "Maximum heap of the compiler JVM");
DEFINE_int32(max_heap_mb, 256, "Maximum heap of the program JVM");
DEFINE_int32(max_stack_kb, 1024, "Maximum thread stack of the program JVM");
DEFINE_int32(max_metaspace_mb, 64, "Maximum metaspace of the program JVM");
DEFINE_int32(max_output_kb, 1024,
             "Maximum amount of output read back from each stream");
DEFINE_int32(max_file_size_kb, 16 * 1024,
             "Maximum size of any file written by the subprocesses");
DEFINE_int32(max_source_kb, 500, "Maximum size of a submitted source");

DEFINE_int32(cache_entries, 100, "Maximum number of cached artifacts");
DEFINE_int32(cache_size, 64, "Maximum size of the artifact cache, in MiB");
DEFINE_int32(low_memory_mb, 0,
             "Shrink the artifact cache when available system memory drops "
             "below this value. 0 disables the check");

DEFINE_bool(memory_probe, true,
            "Launch programs through the heap sampling probe");
DEFINE_int32(memory_probe_interval_ms, 5,
             "Sampling interval of the heap probe");
