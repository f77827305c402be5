#include <gtest/gtest.h>
#include <ky/metrics/metric_callback_visitor.h>

#include <map>

namespace ky::metrics {

namespace {

class Counters final : public MetricContainer {
public:
  Metric hits_{};
  Metric misses_{};

  void Accept(MetricVisitor &visitor) override {
    VISIT_METRICS(hits_);
    VISIT_METRICS(misses_);
  }
};

class Cache final : public MetricContainer {
public:
  Counters counters_{};
  Metric evictions_{};

  void Accept(MetricVisitor &visitor) override {
    VISIT_METRICS(counters_);
    VISIT_METRICS(evictions_);
  }
};

}  // namespace

TEST(MetricCallbackVisitorTests, FlattensNestedContainers) {  // NOLINT
  auto cache = Cache();
  cache.counters_.hits_ = 3;
  cache.counters_.misses_ = 1;
  cache.evictions_ = 7;

  std::map<std::string, MetricValueType> snapshot;
  MetricCallbackVisitor().Snapshot(
      "cache",
      [&snapshot](const std::string &key, MetricValueType value) {
        snapshot[key] = value;
      },
      cache);

  EXPECT_EQ(
      snapshot,
      (std::map<std::string, MetricValueType>{
          {"//cache/counters_/hits_", 3},
          {"//cache/counters_/misses_", 1},
          {"//cache/evictions_", 7}}));
}

TEST(MetricCallbackVisitorTests, EmptyRoot) {  // NOLINT
  auto counters = Counters();
  counters.hits_ = 2;

  std::map<std::string, MetricValueType> snapshot;
  MetricCallbackVisitor().Snapshot(
      "",
      [&snapshot](const std::string &key, MetricValueType value) {
        snapshot[key] = value;
      },
      counters);

  EXPECT_EQ(snapshot.at("//hits_"), 2);
  EXPECT_EQ(snapshot.at("//misses_"), 0);
}

}  // namespace ky::metrics
