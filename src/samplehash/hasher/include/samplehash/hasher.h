#ifndef SAMPLEHASH_SRC_HASHER_HASHER_H
#define SAMPLEHASH_SRC_HASHER_HASHER_H

#include <samplehash/checksums/digest.h>
#include <samplehash/config/hasher_config.h>
#include <samplehash/readers/reader.h>
#include <samplehash/sampling/sample_selector.h>

#include <filesystem>
#include <string>

namespace samplehash {

/**
 * Computes sampled digests of buffers and files.
 *
 * Inputs up to the threshold are hashed in full; larger inputs contribute
 * only their sampled windows, so changes between windows go unnoticed.
 * The input length is always part of the digest.
 *
 * A Hasher is immutable and may be shared between threads.
 */
class Hasher final {
  HasherConfig config_;

public:
  Hasher();

  /// Throws ConfigurationError unless both values are positive.
  Hasher(std::streamsize sample_size, std::streamsize threshold);

  explicit Hasher(const HasherConfig &config);

  [[nodiscard]] const HasherConfig &GetConfig() const;

  [[nodiscard]] SampleSpec SelectSamples(std::streamsize total_length) const;

  [[nodiscard]] Digest Sum(const void *data, std::streamsize size) const;

  [[nodiscard]] Digest Sum(const std::string &data) const;

  /// Throws IoError if the reader fails.
  [[nodiscard]] Digest Sum(Reader &reader) const;

  /// Throws IoError if the file cannot be opened, sized or read.
  [[nodiscard]] Digest SumFile(const std::filesystem::path &path) const;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_HASHER_HASHER_H
