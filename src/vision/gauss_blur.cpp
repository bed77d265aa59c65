#include <imutil/vision/gauss_blur.hpp>
#include "image_cv_utils.hpp"
#include <imutil/core/classify.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace imutil::vision {

namespace ic = imutil::core;

std::expected<ic::Image, ic::ImageError> gauss_blur(const ic::Image& im, double sigma) {
  if (!ic::is_image(im)) {
    return std::unexpected(ic::ImageError::Classification);
  }
  if (!(sigma > 0.0)) {
    return std::unexpected(ic::ImageError::Argument);
  }
  switch (detail::native_type(im.type())) {
    case ic::ImageType::Byte:
    case ic::ImageType::UShort:
    case ic::ImageType::Short:
    case ic::ImageType::Float:
    case ic::ImageType::Double:
    case ic::ImageType::Rgb24:
      break;
    default:
      return std::unexpected(ic::ImageError::Classification);
  }

  auto src = detail::image_to_mat(im);
  if (!src) {
    return std::unexpected(ic::ImageError::Classification);
  }
  cv::Mat dst;
  cv::GaussianBlur(*src, dst, cv::Size(0, 0), sigma, sigma, cv::BORDER_REFLECT);

  auto out = detail::mat_to_image(dst);
  if (!out) {
    return std::unexpected(ic::ImageError::Classification);
  }
  if (im.type() == ic::ImageType::Rgb24) {
    auto bytes = out->data();
    return ic::Image(im.shape(), ic::ImageType::Rgb24, std::vector<std::byte>(bytes.begin(), bytes.end()));
  }
  if (out->type() != im.type()) {
    return out->astype(im.type());  // back to big-endian storage
  }
  return std::move(*out);
}

}  // namespace imutil::vision
