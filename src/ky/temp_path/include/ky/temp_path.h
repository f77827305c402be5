#ifndef SAMPLEHASH_SRC_KY_TEMP_PATH_TEMP_PATH_H
#define SAMPLEHASH_SRC_KY_TEMP_PATH_TEMP_PATH_H

#include <filesystem>

namespace ky {

class TempPath final {
  std::filesystem::path path_;
  bool keep_;

public:
  TempPath();

  TempPath(const std::filesystem::path &parent_path, bool keep);

  TempPath(const TempPath &) = delete;
  TempPath &operator=(const TempPath &) = delete;

  ~TempPath();

  [[nodiscard]] std::filesystem::path GetPath() const;
};

}  // namespace ky

#endif  // SAMPLEHASH_SRC_KY_TEMP_PATH_TEMP_PATH_H
