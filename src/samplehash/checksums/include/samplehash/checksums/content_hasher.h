#ifndef SAMPLEHASH_SRC_CHECKSUMS_CONTENT_HASHER_H
#define SAMPLEHASH_SRC_CHECKSUMS_CONTENT_HASHER_H

#include <array>
#include <cstdint>
#include <ios>

struct XXH3_state_s;

namespace samplehash {

/// 128-bit content hash, big-endian (xxHash canonical byte order).
using RawHash = std::array<uint8_t, 16>;

/**
 * Non-cryptographic 128-bit hash of a byte stream.
 * Current implementation uses XXH3 (https://github.com/Cyan4973/xxHash) with
 * a fixed seed, so results are stable across processes and platforms.
 *
 * Feeding the same bytes through any number of Update calls yields the same
 * digest as a single Compute over their concatenation.
 */
class ContentHasher final {
  XXH3_state_s *state_;

public:
  static constexpr uint64_t kSeed = 0x5a3c'96e1'0f27'b48dULL;

  ContentHasher();

  ContentHasher(const ContentHasher &) = delete;
  ContentHasher &operator=(const ContentHasher &) = delete;

  ~ContentHasher();

  void Update(const void *buffer, std::streamsize size);

  [[nodiscard]] RawHash Digest() const;

  static RawHash Compute(const void *buffer, std::streamsize size);
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_CHECKSUMS_CONTENT_HASHER_H
