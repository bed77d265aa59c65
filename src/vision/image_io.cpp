#include <imutil/vision/image_io.hpp>
#include "image_cv_utils.hpp"
#include <imutil/core/classify.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace imutil::vision {

namespace ic = imutil::core;

namespace {

std::string lower_extension(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

std::expected<ic::Image, ic::ImageError> imread(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) {
    return std::unexpected(ic::ImageError::LoadFailed);
  }

  cv::Mat rgb;
  switch (mat.channels()) {
    case 1:
      rgb = mat;
      break;
    case 3:
      cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
      break;
    case 4:
      cv::cvtColor(mat, rgb, cv::COLOR_BGRA2RGB);
      break;
    default:
      return std::unexpected(ic::ImageError::LoadFailed);
  }

  auto image = detail::mat_to_image(rgb);
  if (!image) {
    return std::unexpected(ic::ImageError::LoadFailed);
  }
  return std::move(*image);
}

std::expected<void, ic::ImageError> imsave(const std::string& path, const ic::Image& im) {
  auto mat = detail::image_to_mat(im);
  if (!mat) {
    return std::unexpected(ic::ImageError::Classification);
  }
  std::vector<int> params;
  if (im.type() == ic::ImageType::Bit) {
    *mat *= 255;
    if (lower_extension(path) == ".png") {
      params = {cv::IMWRITE_PNG_BILEVEL, 1};
    }
  }
  if (ic::is_rgb24(im)) {
    cv::cvtColor(*mat, *mat, cv::COLOR_RGB2BGR);
  }

  try {
    if (!cv::imwrite(path, *mat, params)) {
      return std::unexpected(ic::ImageError::SaveFailed);
    }
  } catch (const cv::Exception&) {
    // Unknown extension or a depth the chosen codec cannot store.
    return std::unexpected(ic::ImageError::SaveFailed);
  }
  return {};
}

std::expected<ic::Histogram, ic::ImageError> imhist_files(const std::vector<std::string>& paths,
                                                          std::size_t nbins) {
  ic::Histogram total(nbins, 0);
  for (const auto& path : paths) {
    auto image = imread(path);
    if (!image) {
      return std::unexpected(image.error());
    }
    auto h = ic::imhist(*image, nbins);
    if (!h) {
      return std::unexpected(h.error());
    }
    std::transform(total.begin(), total.end(), h->begin(), total.begin(), std::plus<>());
  }
  return total;
}

}  // namespace imutil::vision
