#include "manager/memory_probe.hpp"

#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "glog/logging.h"

namespace manager {

constexpr const char* MemoryProbe::kClassName;
constexpr const char* MemoryProbe::kSourceFile;
constexpr const char* MemoryProbe::kPeakMemoryFile;
constexpr const char* MemoryProbe::kIntervalProperty;
constexpr int64_t MemoryProbe::kPlaceholderBytes;

const std::string& MemoryProbe::Source() {
  static const std::string* source = new std::string(R"java(
import java.io.FileOutputStream;
import java.lang.reflect.InvocationTargetException;
import java.lang.reflect.Method;
import java.nio.charset.StandardCharsets;
import java.util.concurrent.atomic.AtomicLong;

public final class __SandboxMemoryProbe {
    private static final AtomicLong peak = new AtomicLong();
    private static boolean reported = false;

    private static void sample() {
        Runtime runtime = Runtime.getRuntime();
        long used = runtime.totalMemory() - runtime.freeMemory();
        long current;
        while (used > (current = peak.get())) {
            if (peak.compareAndSet(current, used)) break;
        }
    }

    private static synchronized void report() {
        if (reported) return;
        reported = true;
        sample();
        try (FileOutputStream out = new FileOutputStream("peak_memory")) {
            out.write(Long.toString(peak.get()).getBytes(StandardCharsets.US_ASCII));
        } catch (Throwable t) {
            // The parent falls back to a placeholder value.
        }
    }

    public static void main(String[] args) throws Throwable {
        final long interval = Math.max(1L, Long.getLong("probe.interval", 5L));
        Thread sampler = new Thread(() -> {
            while (true) {
                sample();
                try {
                    Thread.sleep(interval);
                } catch (InterruptedException e) {
                    return;
                }
            }
        }, "memory-probe");
        sampler.setDaemon(true);
        sampler.start();
        Runtime.getRuntime().addShutdownHook(
            new Thread(__SandboxMemoryProbe::report, "memory-probe-report"));

        String[] rest = new String[args.length - 1];
        System.arraycopy(args, 1, rest, 0, rest.length);
        Method main = Class.forName(args[0]).getMethod("main", String[].class);
        main.setAccessible(true);
        try {
            main.invoke(null, (Object) rest);
        } catch (InvocationTargetException e) {
            throw e.getCause();
        } finally {
            report();
        }
    }
}
)java");
  return *source;
}

void MemoryProbe::WriteSource(core::Workspace* workspace) {
  workspace->WriteText(kSourceFile, Source());
}

int64_t MemoryProbe::ReadPeak(const core::Workspace& workspace,
                              int64_t max_bytes) {
  std::string contents;
  try {
    contents = workspace.ReadBytes(kPeakMemoryFile);
  } catch (const std::system_error& e) {
    VLOG(1) << "No memory measurement: " << e.what();
    return kPlaceholderBytes;
  }
  int64_t peak = 0;
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(contents), &peak) ||
      peak <= 0 || (max_bytes > 0 && peak > max_bytes)) {
    VLOG(1) << "Discarding memory measurement '" << contents << "'";
    return kPlaceholderBytes;
  }
  return peak;
}

}  // namespace manager
