#include <imutil/app/pipeline_runner.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <vector>

namespace ia = imutil::app;
namespace ic = imutil::core;

namespace {

// Doubles every value of a Byte image; odd-sized images are rejected.
class DoubleStage : public ic::IPipelineStage {
 public:
  std::expected<ic::Image, ic::ImageError> process(const ic::Image& input) const override {
    if (input.element_count() % 2 != 0) {
      return std::unexpected(ic::ImageError::Argument);
    }
    std::vector<int> values = input.values<int>();
    for (int& v : values) v *= 2;
    return ic::Image::from_values<int>(input.shape(), input.type(), values);
  }
};

ic::Pipeline make_pipeline() {
  ic::Pipeline p;
  p.add_stage(std::make_unique<DoubleStage>());
  return p;
}

std::vector<ic::Image> make_images(std::size_t n) {
  std::vector<ic::Image> images;
  for (std::size_t i = 0; i < n; ++i) {
    const int v = static_cast<int>(i);
    images.push_back(ic::Image::from_values<int>({1, 2}, ic::ImageType::Byte, {v, v + 1}));
  }
  return images;
}

}  // namespace

TEST(PipelineRunner, RunSingleImage) {
  ic::Pipeline p = make_pipeline();
  auto result = ia::run_pipeline(p, make_images(4)[3]);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->values<int>(), (std::vector<int>{6, 8}));
}

TEST(PipelineRunner, BatchKeepsOrder) {
  ic::Pipeline p = make_pipeline();
  std::vector<std::size_t> order;
  ia::run_pipeline_batch(p, make_images(5), [&](std::size_t i, const ia::ImageResult& r) {
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->values<int>()[0], static_cast<int>(2 * i));
    order.push_back(i);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST(PipelineRunner, ParallelReportsEveryIndexOnce) {
  ic::Pipeline p = make_pipeline();
  const auto images = make_images(16);
  std::vector<int> seen(images.size(), 0);
  std::mutex mutex;
  ia::run_pipeline_batch_parallel(
      p, images,
      [&](std::size_t i, const ia::ImageResult& r) {
        std::lock_guard lock(mutex);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->values<int>()[1], static_cast<int>(2 * (i + 1)));
        ++seen[i];
      },
      4);
  EXPECT_EQ(seen, std::vector<int>(images.size(), 1));
}

TEST(PipelineRunner, ErrorsAreReportedPerImage) {
  ic::Pipeline p = make_pipeline();
  std::vector<ic::Image> images = make_images(2);
  images.push_back(ic::Image::zeros({1, 3}, ic::ImageType::Byte));
  std::vector<bool> ok;
  ia::run_pipeline_batch(p, images, [&](std::size_t, const ia::ImageResult& r) {
    ok.push_back(r.has_value());
  });
  EXPECT_EQ(ok, (std::vector<bool>{true, true, false}));
}

TEST(PipelineRunner, EmptyBatchDoesNotCallCallback) {
  ic::Pipeline p = make_pipeline();
  int calls = 0;
  ia::run_pipeline_batch_parallel(p, {}, [&](std::size_t, const ia::ImageResult&) { ++calls; });
  EXPECT_EQ(calls, 0);
}
