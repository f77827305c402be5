#ifndef SAMPLEHASH_SRC_COMMANDS_HASH_COMMAND_H
#define SAMPLEHASH_SRC_COMMANDS_HASH_COMMAND_H

#include <ky/metrics/metrics.h>
#include <samplehash/config/hasher_config.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace samplehash {

/**
 * Writes one `<digest>  <name>` line per input to `output`.
 *
 * Hashes `text` (named "-") when given, otherwise every path in order.
 * A failing path is logged and skipped.
 */
class HashCommand final : public ky::metrics::MetricContainer {
  HasherConfig config_;
  std::vector<std::filesystem::path> paths_;
  std::optional<std::string> text_;
  bool show_metrics_;
  std::ostream &output_;

  ky::metrics::Metric inputs_hashed_{};
  ky::metrics::Metric inputs_failed_{};

  int HashPaths();

public:
  static constexpr int kExitOk = 0;
  static constexpr int kExitFailedInput = 1;
  static constexpr int kExitUsage = 2;

  HashCommand(
      HasherConfig config,
      std::vector<std::filesystem::path> paths,
      std::optional<std::string> text,
      bool show_metrics,
      std::ostream &output);

  int Run();

  void Accept(ky::metrics::MetricVisitor &visitor) override;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_COMMANDS_HASH_COMMAND_H
