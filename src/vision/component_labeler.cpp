#include <imutil/vision/component_labeler.hpp>
#include "image_cv_utils.hpp"
#include <imutil/core/classify.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>

namespace imutil::vision {

namespace ic = imutil::core;

std::expected<ic::Components, ic::ImageError> CvComponentLabeler::label(const ic::Image& mask) const {
  if (!ic::is_plain_image(mask)) {
    return std::unexpected(ic::ImageError::Classification);
  }
  if (mask.empty()) {
    return ic::Components{ic::Image::zeros(mask.shape(), ic::ImageType::Int), 0};
  }

  cv::Mat foreground(static_cast<int>(mask.rows()), static_cast<int>(mask.cols()), CV_8UC1);
  auto* out = foreground.ptr<std::uint8_t>();
  std::size_t i = 0;
  mask.view().for_each([&](auto v) { out[i++] = v != 0 ? 1 : 0; });

  cv::Mat labels;
  const int n = cv::connectedComponents(foreground, labels, 4, CV_32S);
  auto image = detail::mat_to_image(labels);
  if (!image) {
    return std::unexpected(ic::ImageError::Classification);
  }
  // connectedComponents counts the background as label 0.
  return ic::Components{std::move(*image), static_cast<std::uint64_t>(n > 0 ? n - 1 : 0)};
}

std::expected<ic::Components, ic::ImageError> label(const ic::Image& im) {
  return CvComponentLabeler{}.label(im);
}

}  // namespace imutil::vision
