#ifndef SAMPLEHASH_SRC_READERS_MEMORY_READER_H
#define SAMPLEHASH_SRC_READERS_MEMORY_READER_H

#include <samplehash/readers/reader.h>

namespace samplehash {

/// Reads from a caller-owned buffer that must outlive the reader.
class MemoryReader final : public Reader {
  const void *data_;
  std::streamsize data_size_;

public:
  MemoryReader(const void *data, std::streamsize data_size);

  [[nodiscard]] std::streamsize GetSize() const override;

  [[nodiscard]] std::string GetUri() const override;

  std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size) override;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_READERS_MEMORY_READER_H
