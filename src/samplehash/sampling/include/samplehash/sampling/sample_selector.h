#ifndef SAMPLEHASH_SRC_SAMPLING_SAMPLE_SELECTOR_H
#define SAMPLEHASH_SRC_SAMPLING_SAMPLE_SELECTOR_H

#include <ios>
#include <ostream>
#include <vector>

namespace samplehash {

struct SampleRange {
  std::streamoff offset;
  std::streamsize size;

  [[nodiscard]] std::streamoff End() const { return offset + size; }

  bool operator==(const SampleRange &other) const = default;
};

std::ostream &operator<<(std::ostream &out, const SampleRange &range);

/// Ordered, non-overlapping ranges of an input that contribute to its digest.
using SampleSpec = std::vector<SampleRange>;

/**
 * Decides which bytes of an input of `total_length` bytes get hashed.
 *
 * - inputs of at most `threshold` bytes are covered by a single range
 * - larger inputs get up to three `sample_size` windows: at the start,
 *   centered on the middle and at the end
 * - windows are clamped to the input and overlapping or touching windows are
 *   merged, so a window set that covers everything collapses to the single
 *   full range
 *
 * Throws ConfigurationError if `sample_size` or `threshold` is not positive.
 */
SampleSpec SelectSamples(
    std::streamsize total_length,
    std::streamsize sample_size,
    std::streamsize threshold);

/// Sum of the range sizes.
std::streamsize GetCoveredSize(const SampleSpec &spec);

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_SAMPLING_SAMPLE_SELECTOR_H
