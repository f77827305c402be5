#ifndef SAMPLEHASH_SRC_CONFIG_HASHER_CONFIG_H
#define SAMPLEHASH_SRC_CONFIG_HASHER_CONFIG_H

#include <ios>
#include <ostream>

namespace samplehash {

struct HasherConfig {
  static constexpr std::streamsize kDefaultSampleSize = 16 * 1024;
  static constexpr std::streamsize kDefaultThreshold = 128 * 1024;

  /// bytes per sampled window
  std::streamsize sample_size = kDefaultSampleSize;

  /// inputs of at most this many bytes are hashed in full
  std::streamsize threshold = kDefaultThreshold;

  /// Throws ConfigurationError unless both values are positive.
  void Validate() const;

  bool operator==(const HasherConfig &other) const = default;
};

std::ostream &operator<<(std::ostream &out, const HasherConfig &config);

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_CONFIG_HASHER_CONFIG_H
