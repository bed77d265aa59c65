#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <expected>

namespace imutil::vision {

/// Gaussian blur (reflect border, kernel size derived from sigma); same shape and type.
/// Supports Byte, UShort, Short, Float, Double (either byte order) and RGB images.
[[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError> gauss_blur(
    const imutil::core::Image& im, double sigma = 1.0);

}  // namespace imutil::vision
