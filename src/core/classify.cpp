#include <imutil/core/classify.hpp>
#include <imutil/core/element.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace imutil::core {

bool is_rgb24(const Image& im) noexcept {
  return (im.ndim() == 2 && im.type() == ImageType::Rgb24) ||
         (im.ndim() == 3 && im.shape()[2] == 3 && im.type() == ImageType::Byte);
}

bool is_plain_image(const Image& im) noexcept {
  return im.ndim() == 2 && (is_integer_type(im.type()) || is_float_type(im.type()));
}

bool is_image(const Image& im) noexcept { return is_rgb24(im) || is_plain_image(im); }

std::expected<ValueRange, ImageError> min_max(ImageType type) {
  if (type == ImageType::Rgb24) {
    return std::unexpected(ImageError::Classification);
  }
  if (type == ImageType::Bit || is_float_type(type)) {
    return ValueRange{0.0, 1.0};
  }
  return detail::visit_scalar(type, [](auto elem) {
    using T = typename decltype(elem)::value_type;
    return ValueRange{static_cast<double>(std::numeric_limits<T>::min()),
                      static_cast<double>(std::numeric_limits<T>::max())};
  });
}

std::expected<ValueRange, ImageError> min_max(const Image& im) {
  if (!is_float_type(im.type()) || im.empty()) {
    return min_max(im.type());
  }
  double mn = std::numeric_limits<double>::infinity();
  double mx = -std::numeric_limits<double>::infinity();
  im.view().for_each([&](auto v) {
    mn = std::min(mn, static_cast<double>(v));
    mx = std::max(mx, static_cast<double>(v));
  });
  if (mn < 0.0 || mx > 1.0) {
    return ValueRange{mn, mx};
  }
  return min_max(im.type());
}

}  // namespace imutil::core
