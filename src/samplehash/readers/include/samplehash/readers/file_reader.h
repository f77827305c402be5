#ifndef SAMPLEHASH_SRC_READERS_FILE_READER_H
#define SAMPLEHASH_SRC_READERS_FILE_READER_H

#include <samplehash/readers/reader.h>

#include <filesystem>
#include <fstream>

namespace samplehash {

/// Holds the file open for the lifetime of the reader.
class FileReader final : public Reader {
  std::filesystem::path path_;
  std::ifstream data_;

public:
  /// Throws IoError if the file does not exist or cannot be opened.
  explicit FileReader(const std::filesystem::path &path);

  /// Throws IoError if the size cannot be determined.
  [[nodiscard]] std::streamsize GetSize() const override;

  [[nodiscard]] std::string GetUri() const override;

  [[nodiscard]] std::filesystem::path GetPath() const override;

  std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size) override;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_READERS_FILE_READER_H
