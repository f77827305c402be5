#include <gflags/gflags.h>
#include <glog/logging.h>
#include <ky/noexcept.h>
#include <samplehash/commands/hash_command.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

DEFINE_int64(  // NOLINT
    sample_size,
    samplehash::HasherConfig::kDefaultSampleSize,
    "bytes per sampled window");
DEFINE_int64(  // NOLINT
    threshold,
    samplehash::HasherConfig::kDefaultThreshold,
    "inputs up to this many bytes are hashed in full");
DEFINE_string(string, "", "hash this text instead of files");  // NOLINT
DEFINE_bool(show_metrics, false, "log read metrics for each input");  // NOLINT

int main(int argc, char **argv) {
  return ky::NoExcept([&argc, &argv]() {
    google::InitGoogleLogging(argv[0]);

    gflags::SetUsageMessage(
        "samplehash [--sample_size=N] [--threshold=N] FILE...\n"
        "samplehash --string=TEXT");
    gflags::SetVersionString("v0.1");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;
    FLAGS_colorlogtostderr = true;

    std::optional<std::string> text;
    if (!gflags::GetCommandLineFlagInfoOrDie("string").is_default) {
      text = FLAGS_string;
    }

    std::vector<std::filesystem::path> paths;
    for (int i = 1; i < argc; i++) {
      paths.emplace_back(argv[i]);
    }

    auto command = samplehash::HashCommand(
        {FLAGS_sample_size, FLAGS_threshold},
        std::move(paths),
        text,
        FLAGS_show_metrics,
        std::cout);

    auto result = command.Run();
    if (result == samplehash::HashCommand::kExitUsage) {
      gflags::ShowUsageWithFlagsRestrict(argv[0], "main");
    }
    return result;
  });
}
