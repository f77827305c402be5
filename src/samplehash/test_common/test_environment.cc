#include <glog/logging.h>
#include <samplehash/path_config.h>
#include <samplehash/test_common/test_environment.h>

#include <cstdlib>

namespace samplehash {

TestEnvironment::~TestEnvironment() = default;

void TestEnvironment::SetUp() {
  Environment::SetUp();

  static bool logging_initialized = false;

  if (!logging_initialized) {
    auto log_dir = GetEnv("TEST_LOG_DIR", CMAKE_BINARY_DIR / "log");
    std::filesystem::create_directories(log_dir);

    FLAGS_log_dir = log_dir.string();
    google::InitGoogleLogging("samplehash_tests");

    FLAGS_logtostderr = false;
    FLAGS_alsologtostderr = false;

    logging_initialized = true;
  }

  std::filesystem::create_directories(GetTmpRoot());
}

std::filesystem::path TestEnvironment::GetTmpRoot() {
  return GetEnv("TEST_ROOT_DIR", CMAKE_BINARY_DIR / "tmp");
}

std::string TestEnvironment::GetEnv(
    const std::string &name,
    const std::string &default_value) {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  auto *env = std::getenv(name.c_str());
  auto value = env == nullptr ? default_value : env;
  VLOG(1) << name << "=" << value;
  return value;
}

std::filesystem::path TestEnvironment::GetEnv(
    const std::string &name,
    const std::filesystem::path &default_value) {
  return GetEnv(name, default_value.string());
}

}  // namespace samplehash
