#include <samplehash/checksums/digest_composer.h>

#include <algorithm>
#include <tuple>

namespace samplehash {

int GetLengthByteCount(uint64_t length) {
  int count = 0;
  while (length != 0) {
    length >>= 8;
    count++;
  }
  return count;
}

Digest ComposeDigest(const RawHash &raw_hash, uint64_t total_length) {
  static_assert(Digest::kSize == std::tuple_size_v<RawHash>);

  auto count = GetLengthByteCount(total_length);

  Digest::Bytes bytes{};
  bytes[0] = static_cast<uint8_t>(count);
  for (int i = 0; i < count; i++) {
    bytes[1 + i] = static_cast<uint8_t>(total_length >> (8 * i));
  }
  std::copy(
      raw_hash.begin() + 1 + count,
      raw_hash.end(),
      bytes.begin() + 1 + count);

  return Digest(bytes);
}

}  // namespace samplehash
