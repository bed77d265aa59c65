#include <imutil/core/convert.hpp>
#include <imutil/core/element.hpp>
#include <cstddef>

namespace imutil::core {

std::expected<Image, ImageError> bw(const Image& im, double threshold) {
  if (!is_plain_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  Image out = Image::zeros(im.shape(), ImageType::Bit);
  std::byte* dst = out.data().data();
  std::size_t i = 0;
  im.view().for_each([&](auto v) {
    const auto x = static_cast<double>(v);
    const bool white = threshold > 0.0 ? x >= threshold : x < -threshold;
    dst[i++] = white ? std::byte{1} : std::byte{0};
  });
  return out;
}

std::expected<Image, ImageError> float_image(const Image& im,
                                             std::optional<ValueRange> in_scale,
                                             ValueRange out_scale) {
  if (im.type() == ImageType::Rgb24) {
    return std::unexpected(ImageError::Classification);
  }
  if (!in_scale) {
    auto range = min_max(im);
    if (!range) {
      return std::unexpected(range.error());
    }
    in_scale = *range;
  } else if (!(in_scale->first < in_scale->second)) {
    return std::unexpected(ImageError::Argument);
  }
  if (!(out_scale.first < out_scale.second)) {
    return std::unexpected(ImageError::Argument);
  }

  const double in_min = in_scale->first;
  const double out_min = out_scale.first;
  const double k = (out_scale.second - out_min) / (in_scale->second - in_min);

  Image out = Image::zeros(im.shape(), ImageType::Float);
  std::byte* dst = out.data().data();
  std::size_t i = 0;
  im.view().for_each([&](auto v) {
    const auto y = static_cast<float>((static_cast<double>(v) - in_min) * k + out_min);
    detail::Element<float, std::endian::little>::store(dst + i * sizeof(float), y);
    ++i;
  });
  return out;
}

}  // namespace imutil::core
