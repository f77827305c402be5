#include <gtest/gtest.h>
#include <samplehash/test_common/expectation_check_metrics_visitor.h>

#include <sstream>

namespace samplehash {

ExpectationCheckMetricVisitor::ExpectationCheckMetricVisitor(
    ky::metrics::MetricContainer &host,
    std::map<std::string, ky::metrics::MetricValueType> &&expectations)
    : expectations_(std::move(expectations)),
      context_("//") {
  host.Accept(*this);
}

ExpectationCheckMetricVisitor::~ExpectationCheckMetricVisitor() {
  std::stringstream s;
  s << "unmet expectations:" << std::endl;
  for (const auto &[key, value] : expectations_) {
    s << "  {\"" << key << "\", " << value << "}," << std::endl;
  }

  EXPECT_TRUE(expectations_.empty()) << s.str();
}

void ExpectationCheckMetricVisitor::Visit(
    const std::string &name,
    ky::metrics::Metric &value) {
  auto key = context_ + name;

  auto i = expectations_.find(key);
  if (i != expectations_.end()) {
    EXPECT_EQ(value.load(), i->second) << "for metric " << key;
    expectations_.erase(i);
  }
}

void ExpectationCheckMetricVisitor::Visit(
    const std::string &name,
    ky::metrics::MetricContainer &container) {
  auto old_context = context_;
  context_ += name + "/";
  container.Accept(*this);
  context_ = old_context;
}

}  // namespace samplehash
