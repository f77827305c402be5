#ifndef SAMPLEHASH_SRC_READERS_READER_H
#define SAMPLEHASH_SRC_READERS_READER_H

#include <ky/metrics/metrics.h>

#include <filesystem>
#include <ios>
#include <string>

namespace samplehash {

/// Random access to the bytes of one input.
class Reader : public ky::metrics::MetricContainer {
  ky::metrics::Metric total_reads_{};
  ky::metrics::Metric total_bytes_read_{};

public:
  ~Reader() override = default;

  [[nodiscard]] virtual std::streamsize GetSize() const = 0;

  /// Identifies the input in logs and errors, e.g. `file:///tmp/x`.
  [[nodiscard]] virtual std::string GetUri() const = 0;

  /// Path reported by IoError; the uri for inputs that are not files.
  [[nodiscard]] virtual std::filesystem::path GetPath() const;

  /**
   * Reads up to `size` bytes starting at `offset` into `buffer`.
   * Returns the number of bytes read, which is short only at the end of data.
   *
   * Implementations must call the base version with the count they read so
   * that the metrics are captured.
   */
  virtual std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size);

  /// Reads exactly `size` bytes or throws IoError.
  void ReadExact(void *buffer, std::streamoff offset, std::streamsize size);

  void Accept(ky::metrics::MetricVisitor &visitor) override;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_READERS_READER_H
