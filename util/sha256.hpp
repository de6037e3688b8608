#ifndef UTIL_SHA256_HPP
#define UTIL_SHA256_HPP

#include <array>
#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"

namespace util {

// Incremental SHA-256 hasher. Finish() may be called only once.
class SHA256 {
 public:
  static const constexpr size_t kDigestSize = 32;
  using Digest = std::array<uint8_t, kDigestSize>;

  SHA256();

  void Update(absl::string_view data);
  Digest Finish();

  // Hashes a whole string at once and returns the lowercase hex digest.
  static std::string Of(absl::string_view data);
  static std::string Hex(const Digest& digest);

 private:
  static const constexpr size_t kBlockSize = 64;
  void Compress(const uint8_t* block);

  std::array<uint32_t, 8> state_;
  std::array<uint8_t, kBlockSize> buffer_;
  size_t buffered_ = 0;
  uint64_t total_bytes_ = 0;
};

}  // namespace util

#endif
