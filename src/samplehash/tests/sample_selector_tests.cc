#include <glog/logging.h>
#include <gtest/gtest.h>
#include <samplehash/errors.h>
#include <samplehash/sampling/sample_selector.h>

#include <string>
#include <vector>

namespace samplehash {

namespace {

class CapturingSink final : public google::LogSink {
public:
  std::vector<std::string> messages_;

  CapturingSink() { google::AddLogSink(this); }

  CapturingSink(const CapturingSink &) = delete;
  CapturingSink &operator=(const CapturingSink &) = delete;

  ~CapturingSink() override { google::RemoveLogSink(this); }

  void send(
      google::LogSeverity /*severity*/,
      const char * /*full_filename*/,
      const char * /*base_filename*/,
      int /*line*/,
      const struct ::tm * /*tm_time*/,
      const char *message,
      size_t message_len) override {
    messages_.emplace_back(message, message_len);
  }
};

}  // namespace

TEST(SampleSelectorTests, EmptyInput) {  // NOLINT
  EXPECT_EQ(SelectSamples(0, 16, 128), (SampleSpec{{0, 0}}));
}

TEST(SampleSelectorTests, BelowThresholdIsFullyCovered) {  // NOLINT
  EXPECT_EQ(SelectSamples(5, 3, 45), (SampleSpec{{0, 5}}));
}

TEST(SampleSelectorTests, ThresholdBoundary) {  // NOLINT
  EXPECT_EQ(SelectSamples(50, 10, 50), (SampleSpec{{0, 50}}));
  EXPECT_EQ(
      SelectSamples(51, 10, 50),
      (SampleSpec{{0, 10}, {20, 10}, {41, 10}}));
}

TEST(SampleSelectorTests, ThreeWindows) {  // NOLINT
  EXPECT_EQ(
      SelectSamples(100, 10, 50),
      (SampleSpec{{0, 10}, {45, 10}, {90, 10}}));
}

TEST(SampleSelectorTests, DefaultsOnTenMegabytes) {  // NOLINT
  auto spec = SelectSamples(10'000'000, 16 * 1024, 128 * 1024);
  ASSERT_EQ(spec.size(), 3);
  EXPECT_EQ(spec[0], (SampleRange{0, 16384}));
  EXPECT_EQ(spec[1], (SampleRange{4'991'808, 16384}));
  EXPECT_EQ(spec[2], (SampleRange{10'000'000 - 16384, 16384}));
}

TEST(SampleSelectorTests, OverlappingWindowsCollapseToFullRange) {  // NOLINT
  EXPECT_EQ(SelectSamples(25, 10, 20), (SampleSpec{{0, 25}}));
  EXPECT_EQ(SelectSamples(30, 10, 20), (SampleSpec{{0, 30}}));
}

TEST(SampleSelectorTests, SampleLargerThanInput) {  // NOLINT
  EXPECT_EQ(SelectSamples(10, 100, 5), (SampleSpec{{0, 10}}));
}

TEST(SampleSelectorTests, Invariants) {  // NOLINT
  for (std::streamsize length = 0; length < 300; length++) {
    for (std::streamsize sample_size = 1; sample_size < 40; sample_size += 3) {
      for (std::streamsize threshold : {1, 7, 64, 250}) {
        auto spec = SelectSamples(length, sample_size, threshold);
        ASSERT_FALSE(spec.empty());

        if (length <= threshold) {
          EXPECT_EQ(spec, (SampleSpec{{0, length}}));
          continue;
        }

        EXPECT_LE(spec.size(), 3);
        EXPECT_LE(GetCoveredSize(spec), length);
        for (std::size_t i = 0; i < spec.size(); i++) {
          EXPECT_GE(spec[i].offset, 0);
          EXPECT_GT(spec[i].size, 0);
          EXPECT_LE(spec[i].End(), length);
          if (i > 0) {
            // strictly apart, since touching windows are merged
            EXPECT_LT(spec[i - 1].End(), spec[i].offset);
          }
        }
        EXPECT_EQ(spec.front().offset, 0);
        EXPECT_EQ(spec.back().End(), length);

        EXPECT_EQ(spec, SelectSamples(length, sample_size, threshold));
      }
    }
  }
}

TEST(SampleSelectorTests, TracesEveryPlan) {  // NOLINT
  auto old_v = FLAGS_v;
  FLAGS_v = 1;
  std::vector<std::string> messages;
  {
    CapturingSink sink;
    (void)SelectSamples(5, 3, 45);
    (void)SelectSamples(100, 10, 50);
    messages = sink.messages_;
  }
  FLAGS_v = old_v;

  ASSERT_EQ(messages.size(), 2);
  EXPECT_EQ(messages[0], "length 5 hashed in full");
  EXPECT_EQ(
      messages[1],
      "length 100 sampled with 3 range(s), covering 30 byte(s)");
}

TEST(SampleSelectorTests, RejectsNonPositiveConfiguration) {  // NOLINT
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(SelectSamples(10, 0, 5), ConfigurationError);
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(SelectSamples(10, 5, 0), ConfigurationError);
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(SelectSamples(10, -1, 5), ConfigurationError);
}

}  // namespace samplehash
