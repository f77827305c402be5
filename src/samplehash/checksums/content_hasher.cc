#include <glog/logging.h>
#include <samplehash/checksums/content_hasher.h>
#include <xxhash.h>

#include <cstring>

namespace samplehash {

namespace {

RawHash ToRawHash(XXH128_hash_t hash) {
  XXH128_canonical_t canonical;
  XXH128_canonicalFromHash(&canonical, hash);

  RawHash result{};
  static_assert(sizeof(canonical.digest) == sizeof(RawHash));
  memcpy(result.data(), canonical.digest, result.size());
  return result;
}

}  // namespace

ContentHasher::ContentHasher() : state_(XXH3_createState()) {
  CHECK(state_ != nullptr) << "cannot allocate the xxhash state";
  CHECK_EQ(XXH3_128bits_reset_withSeed(state_, kSeed), XXH_OK);
}

ContentHasher::~ContentHasher() { XXH3_freeState(state_); }

void ContentHasher::Update(const void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);
  CHECK_EQ(XXH3_128bits_update(state_, buffer, size), XXH_OK);
}

RawHash ContentHasher::Digest() const {
  return ToRawHash(XXH3_128bits_digest(state_));
}

RawHash ContentHasher::Compute(const void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);
  return ToRawHash(XXH3_128bits_withSeed(buffer, size, kSeed));
}

}  // namespace samplehash
