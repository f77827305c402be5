#ifndef SAMPLEHASH_SRC_CHECKSUMS_DIGEST_COMPOSER_H
#define SAMPLEHASH_SRC_CHECKSUMS_DIGEST_COMPOSER_H

#include <samplehash/checksums/content_hasher.h>
#include <samplehash/checksums/digest.h>

#include <cstdint>

namespace samplehash {

/// Bytes needed to write `length` little-endian without a leading zero byte.
int GetLengthByteCount(uint64_t length);

/**
 * Splices `total_length` into the content hash: byte 0 holds the length byte
 * count B, the next B bytes the length and the remaining 15 - B bytes are the
 * trailing bytes of `raw_hash`.
 */
Digest ComposeDigest(const RawHash &raw_hash, uint64_t total_length);

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_CHECKSUMS_DIGEST_COMPOSER_H
