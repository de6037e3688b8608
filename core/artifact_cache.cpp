#include "core/artifact_cache.hpp"

#include "glog/logging.h"
#include "util/misc.hpp"

namespace core {

ArtifactCache::ArtifactCache(size_t max_entries, size_t max_bytes,
                             int64_t low_memory_kb,
                             MemoryProbe available_memory_kb)
    : max_entries_(max_entries),
      max_bytes_(max_bytes),
      low_memory_kb_(low_memory_kb),
      available_memory_kb_(std::move(available_memory_kb)) {
  if (!available_memory_kb_) {
    available_memory_kb_ = []() { return util::AvailableMemoryKb(); };
  }
}

bool ArtifactCache::Get(const std::string& fingerprint,
                        proto::CompiledArtifact* out) {
  std::shared_ptr<const proto::CompiledArtifact> artifact;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
      misses_++;
      VLOG(1) << "Cache miss for " << fingerprint;
      return false;
    }
    hits_++;
    Touch(fingerprint, &it->second);
    artifact = it->second.artifact;
  }
  VLOG(1) << "Cache hit for " << fingerprint;
  out->CopyFrom(*artifact);
  return true;
}

void ArtifactCache::Put(const std::string& fingerprint,
                        const proto::CompiledArtifact& artifact) {
  std::shared_ptr<const proto::CompiledArtifact> stored =
      std::make_shared<proto::CompiledArtifact>(artifact);
  size_t size = stored->ByteSizeLong();
  if (max_entries_ == 0 || size > max_bytes_) {
    VLOG(1) << "Not caching " << fingerprint << " (" << size << " bytes)";
    return;
  }
  bool low_memory = false;
  if (low_memory_kb_ > 0) {
    int64_t available = available_memory_kb_();
    low_memory = available >= 0 && available < low_memory_kb_;
    if (low_memory) {
      LOG(WARNING) << "Low memory (" << available
                   << " KiB available), shrinking the artifact cache";
    }
  }

  std::lock_guard<std::mutex> lck(mutex_);
  if (low_memory) ShrinkTo(max_entries_, total_bytes_ / 2);
  Evict(fingerprint);
  Entry entry{std::move(stored), size, 0};
  Touch(fingerprint, &entry);
  entries_.emplace(fingerprint, std::move(entry));
  total_bytes_ += size;
  ShrinkTo(max_entries_, max_bytes_);
}

void ArtifactCache::Clear() {
  std::lock_guard<std::mutex> lck(mutex_);
  entries_.clear();
  sorted_entries_.clear();
  total_bytes_ = 0;
}

size_t ArtifactCache::Size() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return entries_.size();
}

size_t ArtifactCache::Bytes() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return total_bytes_;
}

uint64_t ArtifactCache::Hits() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return hits_;
}

uint64_t ArtifactCache::Misses() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return misses_;
}

void ArtifactCache::Evict(const std::string& fingerprint) {
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) return;
  sorted_entries_.erase(it->second.access_time);
  total_bytes_ -= it->second.size;
  entries_.erase(it);
}

void ArtifactCache::Touch(const std::string& fingerprint, Entry* entry) {
  if (entry->access_time != 0) sorted_entries_.erase(entry->access_time);
  entry->access_time = ++last_access_time_;
  sorted_entries_.emplace(entry->access_time, fingerprint);
}

void ArtifactCache::ShrinkTo(size_t max_entries, size_t max_bytes) {
  while (!sorted_entries_.empty() &&
         (entries_.size() > max_entries || total_bytes_ > max_bytes)) {
    std::string oldest = sorted_entries_.begin()->second;
    VLOG(1) << "Evicting " << oldest << " from the artifact cache";
    Evict(oldest);
  }
}

}  // namespace core
