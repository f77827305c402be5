#ifndef SAMPLEHASH_SRC_KY_METRICS_METRIC_CALLBACK_VISITOR_H
#define SAMPLEHASH_SRC_KY_METRICS_METRIC_CALLBACK_VISITOR_H

#include <ky/metrics/metrics.h>

#include <functional>
#include <string>
#include <vector>

namespace ky::metrics {

/***
 * Flattens a metric tree into "//context/name" keys and hands each one to a
 * callback.
 */
class MetricCallbackVisitor final : private MetricVisitor {
public:
  using Callback =
      std::function<void(const std::string &key, MetricValueType value)>;

  void Snapshot(
      const std::string &root,
      Callback callback,
      MetricContainer &container);

private:
  Callback callback_;
  std::vector<std::string> context_;

  void Visit(const std::string &name, MetricContainer &container) override;
  void Visit(const std::string &name, Metric &value) override;
};

}  // namespace ky::metrics

#endif  // SAMPLEHASH_SRC_KY_METRICS_METRIC_CALLBACK_VISITOR_H
