#include <glog/logging.h>
#include <ky/metrics/metric_callback_visitor.h>
#include <samplehash/commands/hash_command.h>
#include <samplehash/errors.h>
#include <samplehash/hasher.h>
#include <samplehash/readers/file_reader.h>

#include <utility>

namespace samplehash {

namespace {

void LogMetrics(const std::string &name, ky::metrics::MetricContainer &host) {
  ky::metrics::MetricCallbackVisitor().Snapshot(
      name,
      [](const std::string &key, ky::metrics::MetricValueType value) {
        LOG(INFO) << key << "=" << value;
      },
      host);
}

}  // namespace

HashCommand::HashCommand(
    HasherConfig config,
    std::vector<std::filesystem::path> paths,
    std::optional<std::string> text,
    bool show_metrics,
    std::ostream &output)
    : config_(config),
      paths_(std::move(paths)),
      text_(std::move(text)),
      show_metrics_(show_metrics),
      output_(output) {}

int HashCommand::Run() {
  try {
    config_.Validate();
  } catch (const ConfigurationError &) {
    return kExitUsage;
  }

  if (!text_ && paths_.empty()) {
    LOG(ERROR) << "nothing to hash";
    return kExitUsage;
  }

  LOG_IF(INFO, show_metrics_) << "configuration " << config_;

  if (text_) {
    output_ << Hasher(config_).Sum(*text_) << "  -" << std::endl;
    inputs_hashed_++;
    return kExitOk;
  }

  auto result = HashPaths();
  if (show_metrics_) {
    LogMetrics("hash", *this);
  }
  return result;
}

int HashCommand::HashPaths() {
  auto hasher = Hasher(config_);
  int result = kExitOk;

  for (const auto &path : paths_) {
    try {
      auto reader = FileReader(path);
      auto digest = hasher.Sum(reader);
      output_ << digest << "  " << path.string() << std::endl;
      inputs_hashed_++;
      if (show_metrics_) {
        LogMetrics(path.string(), reader);
      }
    } catch (const Error &e) {
      LOG(ERROR) << path.string() << ": " << e.what();
      inputs_failed_++;
      result = kExitFailedInput;
    }
  }
  return result;
}

void HashCommand::Accept(ky::metrics::MetricVisitor &visitor) {
  VISIT_METRICS(inputs_hashed_);
  VISIT_METRICS(inputs_failed_);
}

}  // namespace samplehash
