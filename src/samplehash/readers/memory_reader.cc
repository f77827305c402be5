#include <glog/logging.h>
#include <samplehash/readers/memory_reader.h>

#include <algorithm>
#include <cstring>

namespace samplehash {

MemoryReader::MemoryReader(const void *data, std::streamsize data_size)
    : data_(data),
      data_size_(data_size) {
  CHECK_GE(data_size_, 0);
  CHECK(data_ != nullptr || data_size_ == 0);
}

std::streamsize MemoryReader::GetSize() const { return data_size_; }

std::string MemoryReader::GetUri() const {
  return "memory://" + std::to_string(data_size_);
}

std::streamsize
MemoryReader::Read(void *buffer, std::streamoff offset, std::streamsize size) {
  if (offset < 0 || size <= 0 || offset >= data_size_) {
    return Reader::Read(buffer, offset, 0);
  }

  auto count = std::min<std::streamsize>(size, data_size_ - offset);
  memcpy(buffer, static_cast<const char *>(data_) + offset, count);

  // make sure the metrics are captured!
  return Reader::Read(buffer, offset, count);
}

}  // namespace samplehash
