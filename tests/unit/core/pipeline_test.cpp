#include <imutil/core/image.hpp>
#include <imutil/core/pipeline.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace ic = imutil::core;

namespace {

class AddOneStage : public ic::IPipelineStage {
 public:
  std::expected<ic::Image, ic::ImageError> process(const ic::Image& input) const override {
    std::vector<int> values = input.values<int>();
    for (int& v : values) ++v;
    return ic::Image::from_values<int>(input.shape(), input.type(), values);
  }
};

class FailingStage : public ic::IPipelineStage {
 public:
  std::expected<ic::Image, ic::ImageError> process(const ic::Image&) const override {
    return std::unexpected(ic::ImageError::Overflow);
  }
};

ic::Image small() {
  return ic::Image::from_values<int>({1, 2}, ic::ImageType::Byte, {1, 2});
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsInput) {
  ic::Pipeline p;
  auto result = p.run(small());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->values<int>(), (std::vector<int>{1, 2}));
}

TEST(Pipeline, StagesRunInOrder) {
  ic::Pipeline p;
  p.add_stage(std::make_unique<AddOneStage>());
  p.add_stage(std::make_unique<AddOneStage>());
  EXPECT_EQ(p.stage_count(), 2u);
  auto result = p.run(small());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->values<int>(), (std::vector<int>{3, 4}));
}

TEST(Pipeline, StopsAtFirstError) {
  ic::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<AddOneStage>());
  std::vector<std::size_t> timed;
  ic::StageTimingCallback cb = [&](std::size_t i, double) { timed.push_back(i); };
  auto result = p.run(small(), &cb);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ic::ImageError::Overflow);
  EXPECT_EQ(timed, (std::vector<std::size_t>{0}));
}

TEST(Pipeline, NullStageIgnored) {
  ic::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}
