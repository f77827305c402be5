#ifndef SAMPLEHASH_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H
#define SAMPLEHASH_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H

#include <ky/metrics/metrics.h>

#include <map>
#include <string>

namespace samplehash {

/// Checks the metrics of `host` against `expectations` keyed "//path/name".
/// Every expectation must be met; metrics without one are ignored.
class ExpectationCheckMetricVisitor final : public ky::metrics::MetricVisitor {
  std::map<std::string, ky::metrics::MetricValueType> expectations_;
  std::string context_;

public:
  ExpectationCheckMetricVisitor(
      ky::metrics::MetricContainer &host,
      std::map<std::string, ky::metrics::MetricValueType> &&expectations);

  ~ExpectationCheckMetricVisitor() override;

  void Visit(const std::string &name, ky::metrics::Metric &value) override;

  void Visit(const std::string &name, ky::metrics::MetricContainer &container)
      override;
};

}  // namespace samplehash

#endif  // SAMPLEHASH_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H
