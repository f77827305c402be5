#ifndef SAMPLEHASH_SRC_TEST_COMMON_TEST_ENVIRONMENT_H
#define SAMPLEHASH_SRC_TEST_COMMON_TEST_ENVIRONMENT_H

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace samplehash {

class TestEnvironment : public ::testing::Environment {
public:
  ~TestEnvironment() override;

  void SetUp() override;

  [[nodiscard]] static std::filesystem::path GetTmpRoot();

  [[nodiscard]] static std::string GetEnv(
      const std::string &name,
      const std::string &default_value);

  [[nodiscard]] static std::filesystem::path GetEnv(
      const std::string &name,
      const std::filesystem::path &default_value);
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_TEST_COMMON_TEST_ENVIRONMENT_H
