#include <glog/logging.h>
#include <samplehash/checksums/content_hasher.h>
#include <samplehash/checksums/digest_composer.h>
#include <samplehash/hasher.h>
#include <samplehash/readers/file_reader.h>
#include <samplehash/readers/memory_reader.h>

#include <algorithm>
#include <vector>

namespace samplehash {

namespace {

constexpr std::streamsize kBufSize = 64 * 1024;

}  // namespace

Hasher::Hasher() : Hasher(HasherConfig{}) {}

Hasher::Hasher(std::streamsize sample_size, std::streamsize threshold)
    : Hasher(HasherConfig{sample_size, threshold}) {}

Hasher::Hasher(const HasherConfig &config) : config_(config) {
  config_.Validate();
}

const HasherConfig &Hasher::GetConfig() const { return config_; }

SampleSpec Hasher::SelectSamples(std::streamsize total_length) const {
  return samplehash::SelectSamples(
      total_length,
      config_.sample_size,
      config_.threshold);
}

Digest Hasher::Sum(const void *data, std::streamsize size) const {
  auto reader = MemoryReader(data, size);
  return Sum(reader);
}

Digest Hasher::Sum(const std::string &data) const {
  // NOLINTNEXTLINE(cppcoreguidelines-narrowing-conversions)
  return Sum(data.data(), data.size());
}

Digest Hasher::Sum(Reader &reader) const {
  auto size = reader.GetSize();
  auto spec = SelectSamples(size);

  auto content_hasher = ContentHasher();
  std::vector<char> buffer(std::min(kBufSize, GetCoveredSize(spec)));

  for (const auto &range : spec) {
    for (std::streamoff done = 0; done < range.size;) {
      auto count = std::min<std::streamsize>(kBufSize, range.size - done);
      reader.ReadExact(buffer.data(), range.offset + done, count);
      content_hasher.Update(buffer.data(), count);
      done += count;
    }
  }

  auto digest = ComposeDigest(content_hasher.Digest(), size);
  VLOG(1) << reader.GetUri() << " -> " << digest;
  return digest;
}

Digest Hasher::SumFile(const std::filesystem::path &path) const {
  auto reader = FileReader(path);
  return Sum(reader);
}

}  // namespace samplehash
