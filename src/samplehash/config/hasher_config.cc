#include <glog/logging.h>
#include <samplehash/config/hasher_config.h>
#include <samplehash/errors.h>

#include <sstream>

namespace samplehash {

void HasherConfig::Validate() const {
  if (sample_size > 0 && threshold > 0) {
    return;
  }

  std::stringstream s;
  s << "sample_size and threshold must be positive: " << *this;
  LOG(ERROR) << s.str();
  throw ConfigurationError(s.str());
}

std::ostream &operator<<(std::ostream &out, const HasherConfig &config) {
  return out << "{sample_size=" << config.sample_size
             << ", threshold=" << config.threshold << "}";
}

}  // namespace samplehash
