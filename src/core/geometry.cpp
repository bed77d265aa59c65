#include <imutil/core/geometry.hpp>
#include <imutil/core/classify.hpp>
#include <imutil/core/element.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>

namespace imutil::core {

namespace {

using Pixel = std::vector<std::byte>;

std::vector<std::size_t> shape_with(const Image& im, std::size_t rows, std::size_t cols) {
  std::vector<std::size_t> shape = im.shape();
  shape[0] = rows;
  shape[1] = cols;
  return shape;
}

Pixel fill_value(const Image& im, double value) {
  Pixel px(im.pixel_bytes());
  if (is_rgb24(im)) {
    std::fill(px.begin(), px.end(), static_cast<std::byte>(static_cast<std::uint8_t>(value)));
    return px;
  }
  detail::visit_scalar(im.type(), [&](auto elem) {
    using V = typename decltype(elem)::value_type;
    elem.store(px.data(), static_cast<V>(value));
  });
  return px;
}

// Scalar pixels compare by value, so -0.0 matches 0.0.
bool pixel_is(const Image& im, std::size_t r, std::size_t c, const Pixel& px) {
  if (is_rgb24(im)) {
    return std::memcmp(im.pixel(r, c), px.data(), px.size()) == 0;
  }
  return detail::visit_scalar(im.type(), [&](auto elem) {
    return elem.load(im.pixel(r, c)) == elem.load(px.data());
  });
}

bool row_is(const Image& im, std::size_t r, const Pixel& px) {
  for (std::size_t c = 0; c < im.cols(); ++c) {
    if (!pixel_is(im, r, c, px)) return false;
  }
  return true;
}

bool col_is(const Image& im, std::size_t c, const Pixel& px) {
  for (std::size_t r = 0; r < im.rows(); ++r) {
    if (!pixel_is(im, r, c, px)) return false;
  }
  return true;
}

Pixel pixel_at(const Image& im, std::size_t r, std::size_t c) {
  const std::byte* p = im.pixel(r, c);
  return Pixel(p, p + im.pixel_bytes());
}

bool fits(const Image& im, const Rectangle& rect) {
  const auto h = static_cast<std::int64_t>(im.rows());
  const auto w = static_cast<std::int64_t>(im.cols());
  return rect.top() >= 0 && rect.top() <= rect.bottom() && rect.bottom() < h &&
         rect.left() >= 0 && rect.left() <= rect.right() && rect.right() < w;
}

void copy_row(Image& im, std::size_t dst, std::size_t src) {
  std::memcpy(im.pixel(dst, 0), im.pixel(src, 0), im.cols() * im.pixel_bytes());
}

void copy_col(Image& im, std::size_t dst, std::size_t src) {
  for (std::size_t r = 0; r < im.rows(); ++r) {
    std::memcpy(im.pixel(r, dst), im.pixel(r, src), im.pixel_bytes());
  }
}

std::expected<void, ImageError> mirror_background(Image& im, const Rectangle& rect) {
  const auto h = static_cast<std::int64_t>(im.rows());
  const auto w = static_cast<std::int64_t>(im.cols());
  const std::int64_t t = rect.top();
  const std::int64_t l = rect.left();
  const std::int64_t b = rect.bottom();
  const std::int64_t r = rect.right();
  if ((t > 0 && 2 * t - 1 >= h) || (l > 0 && 2 * l - 1 >= w) ||
      (b < h - 1 && 2 * b - h + 2 < 0) || (r < w - 1 && 2 * r - w + 2 < 0)) {
    return std::unexpected(ImageError::Argument);
  }
  for (std::int64_t y = 0; y < t; ++y) {
    copy_row(im, static_cast<std::size_t>(y), static_cast<std::size_t>(2 * t - 1 - y));
  }
  for (std::int64_t x = 0; x < l; ++x) {
    copy_col(im, static_cast<std::size_t>(x), static_cast<std::size_t>(2 * l - 1 - x));
  }
  for (std::int64_t k = 0; b + 1 + k < h; ++k) {
    copy_row(im, static_cast<std::size_t>(b + 1 + k), static_cast<std::size_t>(b - k));
  }
  for (std::int64_t k = 0; r + 1 + k < w; ++k) {
    copy_col(im, static_cast<std::size_t>(r + 1 + k), static_cast<std::size_t>(r - k));
  }
  return {};
}

}  // namespace

std::expected<Rectangle, ImageError> get_foreground_area(const Image& im, std::optional<double> bg) {
  if (!is_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  if (im.rows() == 0 || im.cols() == 0) {
    return std::unexpected(ImageError::Argument);
  }
  const std::size_t h = im.rows();
  const std::size_t w = im.cols();

  Pixel background;
  if (bg.has_value()) {
    if (is_rgb24(im)) {
      return std::unexpected(ImageError::Argument);
    }
    background = fill_value(im, *bg);
  } else {
    const Pixel first = pixel_at(im, 0, 0);
    const Pixel last = pixel_at(im, h - 1, w - 1);
    if (row_is(im, 0, first) || col_is(im, 0, first)) {
      background = first;
    } else if (row_is(im, h - 1, last) || col_is(im, w - 1, last)) {
      background = last;
    } else {
      return Rectangle(0, 0, static_cast<std::int64_t>(h - 1), static_cast<std::int64_t>(w - 1));
    }
  }

  std::size_t t = 0;
  std::size_t l = 0;
  std::size_t b = h - 1;
  std::size_t r = w - 1;
  while (t < h - 1 && row_is(im, t, background)) ++t;
  while (b > t && row_is(im, b, background)) --b;
  while (l < w - 1 && col_is(im, l, background)) ++l;
  while (r > l && col_is(im, r, background)) --r;
  return Rectangle(static_cast<std::int64_t>(t), static_cast<std::int64_t>(l),
                   static_cast<std::int64_t>(b), static_cast<std::int64_t>(r));
}

std::expected<void, ImageError> fill_background(Image& im,
                                                 std::optional<Rectangle> rect,
                                                 double bg,
                                                 bool mirror) {
  if (!rect) {
    auto area = get_foreground_area(im);
    if (!area) {
      return std::unexpected(area.error());
    }
    rect = *area;
  } else if (!is_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  if (!fits(im, *rect)) {
    return std::unexpected(ImageError::Argument);
  }
  if (mirror) {
    return mirror_background(im, *rect);
  }

  const Pixel px = fill_value(im, bg);
  const auto top = static_cast<std::size_t>(rect->top());
  const auto left = static_cast<std::size_t>(rect->left());
  const auto bottom = static_cast<std::size_t>(rect->bottom());
  const auto right = static_cast<std::size_t>(rect->right());
  for (std::size_t y = 0; y < im.rows(); ++y) {
    const bool outside_row = y < top || y > bottom;
    for (std::size_t x = 0; x < im.cols(); ++x) {
      if (outside_row || x < left || x > right) {
        std::memcpy(im.pixel(y, x), px.data(), px.size());
      }
    }
  }
  return {};
}

std::expected<Image, ImageError> crop(const Image& im, std::optional<Rectangle> rect) {
  if (!rect) {
    auto area = get_foreground_area(im);
    if (!area) {
      return std::unexpected(area.error());
    }
    rect = *area;
  } else if (!is_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  if (!fits(im, *rect)) {
    return std::unexpected(ImageError::Argument);
  }

  const auto rows = static_cast<std::size_t>(rect->height() + 1);
  const auto cols = static_cast<std::size_t>(rect->width() + 1);
  Image out = Image::zeros(shape_with(im, rows, cols), im.type());
  for (std::size_t y = 0; y < rows; ++y) {
    std::memcpy(out.pixel(y, 0),
                im.pixel(static_cast<std::size_t>(rect->top()) + y, static_cast<std::size_t>(rect->left())),
                cols * im.pixel_bytes());
  }
  return out;
}

std::expected<Image, ImageError> pad(const Image& im,
                                     std::size_t top,
                                     std::size_t left,
                                     std::size_t bottom,
                                     std::size_t right) {
  if (!is_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  Image out = Image::zeros(shape_with(im, im.rows() + top + bottom, im.cols() + left + right), im.type());
  for (std::size_t y = 0; y < im.rows(); ++y) {
    std::memcpy(out.pixel(top + y, left), im.pixel(y, 0), im.cols() * im.pixel_bytes());
  }
  return out;
}

std::expected<Image, ImageError> flip_up_down(const Image& im) {
  if (!is_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  Image out = Image::zeros(im.shape(), im.type());
  const std::size_t row_bytes = im.cols() * im.pixel_bytes();
  for (std::size_t y = 0; y < im.rows(); ++y) {
    std::memcpy(out.pixel(y, 0), im.pixel(im.rows() - 1 - y, 0), row_bytes);
  }
  return out;
}

}  // namespace imutil::core
