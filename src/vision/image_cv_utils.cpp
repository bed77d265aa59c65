#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace imutil::vision::detail {

namespace ic = imutil::core;

ic::ImageType native_type(ic::ImageType type) {
  switch (type) {
    case ic::ImageType::ShortBE:
      return ic::ImageType::Short;
    case ic::ImageType::UShortBE:
      return ic::ImageType::UShort;
    case ic::ImageType::IntBE:
      return ic::ImageType::Int;
    case ic::ImageType::UIntBE:
      return ic::ImageType::UInt;
    case ic::ImageType::LongBE:
      return ic::ImageType::Long;
    case ic::ImageType::ULongBE:
      return ic::ImageType::ULong;
    default:
      return type;
  }
}

std::optional<int> cv_depth(ic::ImageType type) {
  switch (native_type(type)) {
    case ic::ImageType::Bit:
    case ic::ImageType::Byte:
    case ic::ImageType::Rgb24:
      return CV_8U;
    case ic::ImageType::SByte:
      return CV_8S;
    case ic::ImageType::Short:
      return CV_16S;
    case ic::ImageType::UShort:
      return CV_16U;
    case ic::ImageType::Int:
      return CV_32S;
    case ic::ImageType::Float:
      return CV_32F;
    case ic::ImageType::Double:
      return CV_64F;
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> image_to_mat(const ic::Image& im) {
  if (im.ndim() != 2 && im.ndim() != 3) return std::nullopt;
  const auto depth = cv_depth(im.type());
  if (!depth) return std::nullopt;

  int channels = 1;
  if (im.type() == ic::ImageType::Rgb24) {
    if (im.ndim() != 2) return std::nullopt;
    channels = 3;
  } else if (im.ndim() == 3) {
    channels = static_cast<int>(im.shape()[2]);
    if (channels < 1 || channels > CV_CN_MAX) return std::nullopt;
  }

  const ic::ImageType native = native_type(im.type());
  const ic::Image converted = native == im.type() ? ic::Image() : im.astype(native);
  const ic::Image& src = native == im.type() ? im : converted;

  cv::Mat mat(static_cast<int>(im.rows()), static_cast<int>(im.cols()), CV_MAKETYPE(*depth, channels));
  if (!src.empty()) {
    std::memcpy(mat.ptr(), src.data().data(), src.size_bytes());
  }
  return mat;
}

std::optional<ic::Image> mat_to_image(const cv::Mat& mat) {
  ic::ImageType type;
  switch (mat.depth()) {
    case CV_8U:
      type = ic::ImageType::Byte;
      break;
    case CV_8S:
      type = ic::ImageType::SByte;
      break;
    case CV_16U:
      type = ic::ImageType::UShort;
      break;
    case CV_16S:
      type = ic::ImageType::Short;
      break;
    case CV_32S:
      type = ic::ImageType::Int;
      break;
    case CV_32F:
      type = ic::ImageType::Float;
      break;
    case CV_64F:
      type = ic::ImageType::Double;
      break;
    default:
      return std::nullopt;
  }

  const cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
  std::vector<std::size_t> shape = {static_cast<std::size_t>(mat.rows),
                                    static_cast<std::size_t>(mat.cols)};
  if (mat.channels() > 1) {
    shape.push_back(static_cast<std::size_t>(mat.channels()));
  }
  const std::size_t len = continuous.total() * continuous.elemSize();
  std::vector<std::byte> buffer(len);
  if (len > 0) {
    std::memcpy(buffer.data(), continuous.ptr(), len);
  }
  return ic::Image(std::move(shape), type, std::move(buffer));
}

}  // namespace imutil::vision::detail
