#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/labeling.hpp>
#include <imutil/vision/component_labeler.hpp>
#include <imutil/vision/relabel_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace ic = imutil::core;
namespace iv = imutil::vision;

namespace {

ic::Image corners() {
  std::vector<int> v(25, 0);
  v[0] = 1;
  v[24] = 1;
  return ic::Image::from_values<int>({5, 5}, ic::ImageType::Int, v);
}

}  // namespace

TEST(Relabel, ConnectedLabelsAreOnlyRenumbered) {
  ic::Image im = ic::Image::from_values<int>({2, 4}, ic::ImageType::Int,
                                             {10, 10, 0, 40,
                                              10, 0, 0, 40});
  iv::CvComponentLabeler labeler;
  auto result = ic::relabel(im, labeler);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->max_label, 2u);
  EXPECT_EQ(result->image.type(), ic::ImageType::Byte);
  EXPECT_EQ(result->image.values<int>(), (std::vector<int>{1, 1, 0, 2,
                                                           1, 0, 0, 2}));
}

TEST(Relabel, SplitsDisconnectedLabelAndWidens) {
  iv::CvComponentLabeler labeler;
  auto result = ic::relabel(corners(), labeler);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->max_label, 2u);
  EXPECT_EQ(result->image.type(), ic::ImageType::Byte);
  const auto values = result->image.values<int>();
  EXPECT_EQ(values[0], 1);
  EXPECT_EQ(values[24], 2);
  EXPECT_EQ(values[12], 0);
}

TEST(Relabel, NewLabelsGoAboveExisting) {
  ic::Image im = ic::Image::from_values<int>({3, 3}, ic::ImageType::Byte,
                                             {5, 0, 5,
                                              0, 9, 0,
                                              5, 0, 5});
  iv::CvComponentLabeler labeler;
  auto result = ic::relabel(im, labeler);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->max_label, 5u);
  EXPECT_EQ(result->image.values<int>(), (std::vector<int>{1, 0, 3,
                                                           0, 2, 0,
                                                           4, 0, 5}));
}

TEST(Relabel, OverflowWhenWidestTooNarrow) {
  iv::CvComponentLabeler labeler;
  auto result = ic::relabel(corners(), labeler, ic::ImageType::Bit);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ic::ImageError::Overflow);
}

TEST(RelabelStage, RequiresLabeler) {
  EXPECT_THROW(iv::RelabelStage(nullptr), std::invalid_argument);
}

TEST(RelabelStage, ProcessReturnsLabelImage) {
  iv::RelabelStage stage(std::make_unique<iv::CvComponentLabeler>());
  auto out = stage.process(corners());
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->values<int>()[24], 2);
}

TEST(ConsecutivelyNumberStage, DoesNotSplit) {
  iv::ConsecutivelyNumberStage stage;
  auto out = stage.process(corners());
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->type(), ic::ImageType::Bit);
  EXPECT_EQ(out->values<int>()[24], 1);
}
