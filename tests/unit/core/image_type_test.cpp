#include <imutil/core/image_type.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

namespace ic = imutil::core;

TEST(ImageType, ElementSize) {
  EXPECT_EQ(ic::element_size(ic::ImageType::Bit), 1u);
  EXPECT_EQ(ic::element_size(ic::ImageType::ShortBE), 2u);
  EXPECT_EQ(ic::element_size(ic::ImageType::UInt), 4u);
  EXPECT_EQ(ic::element_size(ic::ImageType::Double), 8u);
  EXPECT_EQ(ic::element_size(ic::ImageType::Rgb24), 3u);
}

TEST(ImageType, UnsignedCounterpartKeepsByteOrder) {
  EXPECT_EQ(ic::unsigned_counterpart(ic::ImageType::SByte), ic::ImageType::Byte);
  EXPECT_EQ(ic::unsigned_counterpart(ic::ImageType::Short), ic::ImageType::UShort);
  EXPECT_EQ(ic::unsigned_counterpart(ic::ImageType::IntBE), ic::ImageType::UIntBE);
  EXPECT_EQ(ic::unsigned_counterpart(ic::ImageType::LongBE), ic::ImageType::ULongBE);
  EXPECT_FALSE(ic::unsigned_counterpart(ic::ImageType::UShort).has_value());
  EXPECT_FALSE(ic::unsigned_counterpart(ic::ImageType::Float).has_value());
  EXPECT_FALSE(ic::unsigned_counterpart(ic::ImageType::Bit).has_value());
}

TEST(ImageType, LabelCapacity) {
  EXPECT_EQ(ic::label_capacity(ic::ImageType::Bit), 1u);
  EXPECT_EQ(ic::label_capacity(ic::ImageType::Byte), 255u);
  EXPECT_EQ(ic::label_capacity(ic::ImageType::UShort), 65535u);
  EXPECT_EQ(ic::label_capacity(ic::ImageType::ULong), std::numeric_limits<std::uint64_t>::max());
  EXPECT_EQ(ic::label_capacity(ic::ImageType::Short), 0u);
}

TEST(ImageType, NamesRoundTrip) {
  EXPECT_EQ(ic::type_name(ic::ImageType::UShortBE), "uint16be");
  EXPECT_EQ(ic::parse_type_name("uint32"), ic::ImageType::UInt);
  EXPECT_EQ(ic::parse_type_name("bool"), ic::ImageType::Bit);
  EXPECT_FALSE(ic::parse_type_name("uint128").has_value());
}
