#include <samplehash/errors.h>

#include <sstream>
#include <utility>

namespace samplehash {

namespace {

std::string Describe(
    const std::string &what,
    const std::filesystem::path &path,
    const std::error_code &code) {
  std::stringstream s;
  s << what << " (path=" << path;
  if (code) {
    s << ", cause=" << code.message();
  }
  s << ")";
  return s.str();
}

}  // namespace

Error::Error(const std::string &what) : std::runtime_error(what) {}

ConfigurationError::ConfigurationError(const std::string &what)
    : Error(what) {}

IoError::IoError(
    const std::string &what,
    std::filesystem::path path,
    std::error_code code)
    : Error(Describe(what, path, code)),
      path_(std::move(path)),
      code_(code) {}

const std::filesystem::path &IoError::GetPath() const { return path_; }

const std::error_code &IoError::GetCode() const { return code_; }

}  // namespace samplehash
