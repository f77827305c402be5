#ifndef SAMPLEHASH_SRC_CHECKSUMS_DIGEST_H
#define SAMPLEHASH_SRC_CHECKSUMS_DIGEST_H

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace samplehash {

/**
 * The 16 byte fingerprint of an input.
 *
 * Layout:
 *   [0]           B, the number of bytes used to encode the input length
 *   [1, 1 + B)    input length, little-endian, no leading zero byte
 *   [1 + B, 16)   trailing bytes of the content hash
 */
class Digest {
public:
  static constexpr std::size_t kSize = 16;

  using Bytes = std::array<uint8_t, kSize>;

  Digest();

  explicit Digest(const Bytes &bytes);

  /// Parses 32 hex characters; throws std::invalid_argument for anything
  /// else, or when the length header is not a minimal 0-8 byte encoding.
  static Digest FromString(const std::string &hex);

  [[nodiscard]] const Bytes &GetBytes() const;

  [[nodiscard]] int GetLengthByteCount() const;

  /// The input length recorded in the digest.
  [[nodiscard]] uint64_t GetEmbeddedLength() const;

  /// 32 lowercase hex characters.
  [[nodiscard]] std::string ToString() const;

  bool operator==(const Digest &other) const = default;

private:
  Bytes bytes_;
};

std::ostream &operator<<(std::ostream &out, const Digest &digest);

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_CHECKSUMS_DIGEST_H
