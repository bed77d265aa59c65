#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/histogram.hpp>
#include <imutil/core/image.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace imutil::vision {

/// Load an image file with OpenCV. Gray images keep their depth (Byte, UShort, ...);
/// color images become packed RGB (rows, cols, 3), alpha dropped. LoadFailed on failure.
[[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError> imread(const std::string& path);

/// Save an image with OpenCV; format from the extension. Bit images are written as
/// 0/255 (bilevel for PNG). Classification if OpenCV cannot store the element type.
[[nodiscard]] std::expected<void, imutil::core::ImageError> imsave(const std::string& path,
                                                                   const imutil::core::Image& im);

/// Summed histogram of several image files.
[[nodiscard]] std::expected<imutil::core::Histogram, imutil::core::ImageError> imhist_files(
    const std::vector<std::string>& paths, std::size_t nbins = 256);

}  // namespace imutil::vision
