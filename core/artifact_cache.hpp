#ifndef CORE_ARTIFACT_CACHE_HPP
#define CORE_ARTIFACT_CACHE_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "proto/submission.pb.h"

namespace core {

// In-memory cache of compiled artifacts, keyed by source fingerprint. Keeps
// at most max_entries artifacts and max_bytes of class files, evicting the
// least recently used ones. When the available system memory drops below
// low_memory_kb, half of the cached bytes are reclaimed before inserting.
// Safe to use from multiple threads.
class ArtifactCache {
 public:
  // Returns the available system memory in KiB, or a negative number if it
  // is unknown.
  using MemoryProbe = std::function<int64_t()>;

  ArtifactCache(size_t max_entries, size_t max_bytes, int64_t low_memory_kb = 0,
                MemoryProbe available_memory_kb = nullptr);

  // Copies the artifact for fingerprint into out. Returns false on a miss.
  bool Get(const std::string& fingerprint, proto::CompiledArtifact* out);

  // Stores an artifact, replacing any previous one with the same fingerprint.
  // Artifacts larger than the whole cache are not stored.
  void Put(const std::string& fingerprint,
           const proto::CompiledArtifact& artifact);

  void Clear();

  size_t Size() const;
  size_t Bytes() const;
  uint64_t Hits() const;
  uint64_t Misses() const;

 private:
  struct Entry {
    std::shared_ptr<const proto::CompiledArtifact> artifact;
    size_t size;
    uint64_t access_time;
  };

  // Must be called with mutex_ held.
  void Evict(const std::string& fingerprint);
  void Touch(const std::string& fingerprint, Entry* entry);
  void ShrinkTo(size_t max_entries, size_t max_bytes);

  const size_t max_entries_;
  const size_t max_bytes_;
  const int64_t low_memory_kb_;
  MemoryProbe available_memory_kb_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::map<uint64_t, std::string> sorted_entries_;
  size_t total_bytes_ = 0;
  uint64_t last_access_time_ = 0;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
};

}  // namespace core

#endif
