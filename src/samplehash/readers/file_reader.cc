#include <glog/logging.h>
#include <samplehash/errors.h>
#include <samplehash/readers/file_reader.h>

#include <cerrno>
#include <cstdint>
#include <limits>

namespace samplehash {

namespace fs = std::filesystem;

namespace {

fs::path Canonicalize(const fs::path &path) {
  std::error_code ec;
  auto result = fs::canonical(path, ec);
  if (ec) {
    LOG(ERROR) << "cannot resolve " << path << ": " << ec.message();
    throw IoError("cannot resolve path", path, ec);
  }
  return result;
}

}  // namespace

FileReader::FileReader(const fs::path &path)
    : path_(Canonicalize(path)),
      data_(path_, std::ios::binary) {
  if (!data_) {
    auto ec = std::error_code(errno, std::generic_category());
    LOG(ERROR) << "unable to open " << path_ << " for reading: "
               << ec.message();
    throw IoError("unable to open for reading", path_, ec);
  }
}

std::streamsize FileReader::GetSize() const {
  std::error_code ec;
  auto size = fs::file_size(path_, ec);
  if (ec) {
    LOG(ERROR) << "cannot determine the size of " << path_ << ": "
               << ec.message();
    throw IoError("cannot determine file size", path_, ec);
  }
  if (size > static_cast<std::uintmax_t>(
                 std::numeric_limits<std::streamsize>::max())) {
    LOG(ERROR) << path_ << " is too large (" << size << " bytes)";
    throw ConfigurationError(
        "input length exceeds the supported range: " + path_.string());
  }
  return static_cast<std::streamsize>(size);
}

std::string FileReader::GetUri() const { return "file://" + path_.string(); }

fs::path FileReader::GetPath() const { return path_; }

std::streamsize
FileReader::Read(void *buffer, std::streamoff offset, std::streamsize size) {
  if (offset < 0 || size <= 0) {
    return Reader::Read(buffer, offset, 0);
  }

  // seekg fails while eofbit is set from a previous short read
  data_.clear();

  data_.seekg(offset);
  data_.read(static_cast<char *>(buffer), size);
  if (data_.bad()) {
    auto ec = std::error_code(errno, std::generic_category());
    LOG(ERROR) << "read of " << size << " byte(s) at offset " << offset
               << " failed for " << path_ << ": " << ec.message();
    throw IoError("read failed", path_, ec);
  }
  return Reader::Read(buffer, offset, data_.gcount());
}

}  // namespace samplehash
