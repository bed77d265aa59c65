#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/vision/image_io.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

namespace ic = imutil::core;
namespace iv = imutil::vision;

namespace {

std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(ImageIo, GrayPngRoundTrip) {
  const std::string path = temp_path("imutil_io_gray.png");
  ic::Image im = ic::Image::from_values<int>({2, 3}, ic::ImageType::Byte, {0, 10, 20, 30, 40, 255});
  ASSERT_TRUE(iv::imsave(path, im).has_value());
  auto loaded = iv::imread(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->type(), ic::ImageType::Byte);
  EXPECT_EQ(loaded->values<int>(), im.values<int>());
  std::filesystem::remove(path);
}

TEST(ImageIo, SixteenBitPngKeepsDepth) {
  const std::string path = temp_path("imutil_io_u16.png");
  ic::Image im = ic::Image::from_values<int>({1, 2}, ic::ImageType::UShort, {1000, 65535});
  ASSERT_TRUE(iv::imsave(path, im).has_value());
  auto loaded = iv::imread(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->type(), ic::ImageType::UShort);
  EXPECT_EQ(loaded->values<int>(), (std::vector<int>{1000, 65535}));
  std::filesystem::remove(path);
}

TEST(ImageIo, RgbChannelOrderPreserved) {
  const std::string path = temp_path("imutil_io_rgb.png");
  ic::Image im = ic::Image::from_values<int>({1, 1, 3}, ic::ImageType::Byte, {200, 100, 50});
  ASSERT_TRUE(iv::imsave(path, im).has_value());
  auto loaded = iv::imread(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->shape(), (std::vector<std::size_t>{1, 1, 3}));
  EXPECT_EQ(loaded->values<int>(), (std::vector<int>{200, 100, 50}));
  std::filesystem::remove(path);
}

TEST(ImageIo, BitImageSavedAsBlackAndWhite) {
  const std::string path = temp_path("imutil_io_bit.png");
  ic::Image im = ic::Image::from_values<int>({1, 2}, ic::ImageType::Bit, {0, 1});
  ASSERT_TRUE(iv::imsave(path, im).has_value());
  auto loaded = iv::imread(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->values<int>(), (std::vector<int>{0, 255}));
  std::filesystem::remove(path);
}

TEST(ImageIo, HistogramOfFiles) {
  const std::string a = temp_path("imutil_io_hist_a.png");
  const std::string b = temp_path("imutil_io_hist_b.png");
  ASSERT_TRUE(iv::imsave(a, ic::Image::from_values<int>({1, 2}, ic::ImageType::Byte, {0, 255})).has_value());
  ASSERT_TRUE(iv::imsave(b, ic::Image::from_values<int>({1, 1}, ic::ImageType::Byte, {0})).has_value());
  auto h = iv::imhist_files({a, b}, 2);
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(*h, (ic::Histogram{2, 1}));
  std::filesystem::remove(a);
  std::filesystem::remove(b);
}

TEST(ImageIo, MissingFileFails) {
  auto loaded = iv::imread(temp_path("imutil_io_does_not_exist.png"));
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), ic::ImageError::LoadFailed);
}

TEST(ImageIo, UnsupportedTypeRejected) {
  auto saved = iv::imsave(temp_path("imutil_io_u64.png"), ic::Image::zeros({2, 2}, ic::ImageType::ULong));
  ASSERT_FALSE(saved.has_value());
  EXPECT_EQ(saved.error(), ic::ImageError::Classification);
}
