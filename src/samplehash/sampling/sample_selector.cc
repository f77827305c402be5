#include <glog/logging.h>
#include <samplehash/config/hasher_config.h>
#include <samplehash/sampling/sample_selector.h>

#include <algorithm>
#include <array>

namespace samplehash {

std::ostream &operator<<(std::ostream &out, const SampleRange &range) {
  return out << "[" << range.offset << ", " << range.End() << ")";
}

SampleSpec SelectSamples(
    std::streamsize total_length,
    std::streamsize sample_size,
    std::streamsize threshold) {
  HasherConfig{sample_size, threshold}.Validate();
  CHECK_GE(total_length, 0);

  if (total_length <= threshold) {
    VLOG(1) << "length " << total_length << " hashed in full";
    return {{0, total_length}};
  }

  auto last_begin = std::max<std::streamoff>(total_length - sample_size, 0);
  auto middle = total_length / 2 - sample_size / 2;

  std::array<std::streamoff, 3> begins = {
      0,
      std::clamp<std::streamoff>(middle, 0, last_begin),
      last_begin};

  SampleSpec spec;
  for (auto begin : begins) {
    auto end = std::min<std::streamoff>(begin + sample_size, total_length);
    if (!spec.empty() && begin <= spec.back().End()) {
      auto &back = spec.back();
      back.size = std::max(back.End(), end) - back.offset;
    } else {
      spec.push_back({begin, end - begin});
    }
  }

  VLOG(1) << "length " << total_length << " sampled with " << spec.size()
          << " range(s), covering " << GetCoveredSize(spec) << " byte(s)";
  return spec;
}

std::streamsize GetCoveredSize(const SampleSpec &spec) {
  std::streamsize result = 0;
  for (const auto &range : spec) {
    result += range.size;
  }
  return result;
}

}  // namespace samplehash
