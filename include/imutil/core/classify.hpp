#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/image_type.hpp>
#include <expected>
#include <utility>

namespace imutil::core {

/// (min, max) value bounds.
using ValueRange = std::pair<double, double>;

/// 3-channel byte image: (rows, cols, 3) Byte, or (rows, cols) Rgb24 records.
[[nodiscard]] bool is_rgb24(const Image& im) noexcept;

/// 2-D image of an integer (including Bit) or floating element type.
[[nodiscard]] bool is_plain_image(const Image& im) noexcept;

[[nodiscard]] bool is_image(const Image& im) noexcept;

/// Representable range of an element type; floats are nominally (0, 1).
/// Rgb24 has no scalar range (Classification).
[[nodiscard]] std::expected<ValueRange, ImageError> min_max(ImageType type);

/// Range of an image: the type's range, except float images whose data
/// leaves [0, 1], for which the observed (min, max) is returned.
[[nodiscard]] std::expected<ValueRange, ImageError> min_max(const Image& im);

}  // namespace imutil::core
