#include <glog/logging.h>
#include <samplehash/errors.h>
#include <samplehash/readers/reader.h>

#include <sstream>

namespace samplehash {

std::streamsize Reader::Read(
    void * /*buffer*/,
    std::streamoff /*offset*/,
    std::streamsize size) {
  total_reads_++;
  total_bytes_read_ += size;
  return size;
}

std::filesystem::path Reader::GetPath() const { return GetUri(); }

void Reader::ReadExact(
    void *buffer,
    std::streamoff offset,
    std::streamsize size) {
  auto available = GetSize();
  if (offset < 0 || size < 0 || offset > available ||
      size > available - offset) {
    std::stringstream s;
    s << "range [" << offset << ", " << offset + size
      << ") is outside of the input of size " << available;
    LOG(ERROR) << GetUri() << ": " << s.str();
    throw IoError(
        s.str(),
        GetPath(),
        std::make_error_code(std::errc::invalid_argument));
  }

  auto count = Read(buffer, offset, size);
  if (count != size) {
    std::stringstream s;
    s << "short read at offset " << offset << ": expected " << size
      << " byte(s), got " << count;
    LOG(ERROR) << GetUri() << ": " << s.str();
    throw IoError(
        s.str(),
        GetPath(),
        std::make_error_code(std::errc::io_error));
  }
}

void Reader::Accept(ky::metrics::MetricVisitor &visitor) {
  VISIT_METRICS(total_reads_);
  VISIT_METRICS(total_bytes_read_);
}

}  // namespace samplehash
