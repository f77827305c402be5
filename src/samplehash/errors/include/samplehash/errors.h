#ifndef SAMPLEHASH_SRC_ERRORS_ERRORS_H
#define SAMPLEHASH_SRC_ERRORS_ERRORS_H

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace samplehash {

/// Base of every error raised by samplehash.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what);
};

/// Invalid tunables, or an input longer than the digest can describe.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &what);
};

/// A file could not be opened, sized or read.
class IoError : public Error {
  std::filesystem::path path_;
  std::error_code code_;

public:
  IoError(
      const std::string &what,
      std::filesystem::path path,
      std::error_code code);

  [[nodiscard]] const std::filesystem::path &GetPath() const;

  [[nodiscard]] const std::error_code &GetCode() const;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_ERRORS_ERRORS_H
