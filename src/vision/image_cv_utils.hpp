#pragma once

#include <imutil/core/image.hpp>
#include <imutil/core/image_type.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace imutil::vision::detail {

/// Native-order twin of a big-endian type (ShortBE -> Short, ...); other types unchanged.
imutil::core::ImageType native_type(imutil::core::ImageType type);

/// OpenCV depth (CV_8U, ...) holding the element type; nullopt where OpenCV has none.
std::optional<int> cv_depth(imutil::core::ImageType type);

/// Copy of a 2-D image, packed RGB or Rgb24 image as cv::Mat in native byte order.
/// Returns nullopt if the shape or element type has no Mat equivalent.
std::optional<cv::Mat> image_to_mat(const imutil::core::Image& im);

/// Copy of a cv::Mat into an Image: (rows, cols) for one channel, (rows, cols, C) otherwise.
/// Returns nullopt if the depth is unsupported.
std::optional<imutil::core::Image> mat_to_image(const cv::Mat& mat);

}  // namespace imutil::vision::detail
