#include <imutil/core/image.hpp>
#include <cstddef>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace imutil::core {

namespace {

std::size_t product(const std::vector<std::size_t>& shape) {
  if (shape.empty()) return 0;
  return std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                         std::multiplies<std::size_t>());
}

}  // namespace

Image::Image(std::vector<std::size_t> shape, ImageType type, std::vector<std::byte> buffer)
    : shape_(std::move(shape)), type_(type), buffer_(std::move(buffer)) {
  if (buffer_.size() != product(shape_) * element_size(type_)) {
    throw std::invalid_argument("Image: buffer size does not match shape");
  }
}

Image Image::zeros(std::vector<std::size_t> shape, ImageType type) {
  const std::size_t bytes = product(shape) * element_size(type);
  return Image(std::move(shape), type, std::vector<std::byte>(bytes, std::byte{0}));
}

std::size_t Image::element_count() const noexcept {
  return product(shape_);
}

std::size_t Image::pixel_bytes() const noexcept {
  const std::size_t channels = shape_.size() > 2 ? shape_[2] : 1;
  return channels * element_size(type_);
}

std::expected<ImageView, ImageError> Image::view_as(ImageType type) const {
  if (element_size(type) != element_size(type_)) {
    return std::unexpected(ImageError::Argument);
  }
  return ImageView{data(), type, element_count()};
}

Image Image::reinterpret(ImageType type) && {
  if (element_size(type) != element_size(type_)) {
    throw std::invalid_argument("Image::reinterpret: element size mismatch");
  }
  Image out;
  out.shape_ = std::move(shape_);
  out.type_ = type;
  out.buffer_ = std::move(buffer_);
  return out;
}

Image Image::astype(ImageType type) const {
  Image out = zeros(shape_, type);
  const std::size_t step = element_size(type);
  std::byte* dst = out.buffer_.data();
  detail::visit_scalar(type, [&](auto out_elem) {
    using V = typename decltype(out_elem)::value_type;
    std::size_t i = 0;
    view().for_each([&](auto v) {
      out_elem.store(dst + i * step, static_cast<V>(v));
      ++i;
    });
  });
  return out;
}

}  // namespace imutil::core
