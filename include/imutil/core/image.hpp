#pragma once

#include <imutil/core/element.hpp>
#include <imutil/core/error.hpp>
#include <imutil/core/image_type.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

namespace imutil::core {

/// Memory: Image owns a single contiguous row-major buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. data() hands out non-owning spans.
/// Thread-safety: distinct Image instances are independent.

/// Non-owning, read-only view of an image buffer under a (possibly different) element type.
struct ImageView {
  std::span<const std::byte> bytes;
  ImageType type{ImageType::Byte};
  std::size_t count{0};  // number of elements

  template <typename F>
  void for_each(F&& f) const {
    detail::visit_scalar(type, [&](auto elem) {
      const std::size_t step = element_size(type);
      for (std::size_t i = 0; i < count; ++i) {
        f(elem.load(bytes.data() + i * step));
      }
    });
  }
};

/// N-dimensional numeric array: shape, element type and owned buffer.
/// Images proper are 2-D (rows, cols) or 3-D (rows, cols, 3) packed RGB;
/// 1-D arrays are used for target histograms.
class Image {
 public:
  Image() = default;

  /// Throws std::invalid_argument if buffer size does not match shape and type.
  Image(std::vector<std::size_t> shape, ImageType type, std::vector<std::byte> buffer);

  /// Zero-filled image.
  [[nodiscard]] static Image zeros(std::vector<std::size_t> shape, ImageType type);

  /// Build from values converted to the element type (scalar types only).
  template <typename T>
  [[nodiscard]] static Image from_values(std::vector<std::size_t> shape,
                                         ImageType type,
                                         const std::vector<T>& values) {
    Image im = zeros(std::move(shape), type);
    if (values.size() != im.element_count()) {
      throw std::invalid_argument("Image::from_values: value count does not match shape");
    }
    detail::visit_scalar(type, [&](auto elem) {
      using V = typename decltype(elem)::value_type;
      std::byte* out = im.buffer_.data();
      for (std::size_t i = 0; i < values.size(); ++i) {
        elem.store(out + i * sizeof(V), static_cast<V>(values[i]));
      }
    });
    return im;
  }

  /// All elements converted to T (scalar types only).
  template <typename T>
  [[nodiscard]] std::vector<T> values() const {
    std::vector<T> out;
    out.reserve(element_count());
    view().for_each([&](auto v) { out.push_back(static_cast<T>(v)); });
    return out;
  }

  [[nodiscard]] std::size_t ndim() const noexcept { return shape_.size(); }
  [[nodiscard]] const std::vector<std::size_t>& shape() const noexcept { return shape_; }
  [[nodiscard]] std::size_t rows() const noexcept { return shape_.empty() ? 0 : shape_[0]; }
  [[nodiscard]] std::size_t cols() const noexcept { return shape_.size() < 2 ? 1 : shape_[1]; }
  [[nodiscard]] ImageType type() const noexcept { return type_; }

  /// Product of the shape (numpy `size`).
  [[nodiscard]] std::size_t element_count() const noexcept;
  /// Bytes of one (row, col) pixel: element size times the channel axis, if any.
  [[nodiscard]] std::size_t pixel_bytes() const noexcept;

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Pointer to pixel (row, col) of a 2-D or 3-D image.
  [[nodiscard]] std::byte* pixel(std::size_t row, std::size_t col) noexcept {
    return buffer_.data() + (row * cols() + col) * pixel_bytes();
  }
  [[nodiscard]] const std::byte* pixel(std::size_t row, std::size_t col) const noexcept {
    return buffer_.data() + (row * cols() + col) * pixel_bytes();
  }

  /// View of the buffer under its own element type.
  [[nodiscard]] ImageView view() const noexcept {
    return ImageView{data(), type_, element_count()};
  }

  /// Bit-pattern view under another element type of the same size; no copy.
  [[nodiscard]] std::expected<ImageView, ImageError> view_as(ImageType type) const;

  /// Re-tags the buffer with another element type of the same size; no copy.
  /// Throws std::invalid_argument on size mismatch.
  [[nodiscard]] Image reinterpret(ImageType type) &&;

  /// Value-converting copy into another scalar type.
  [[nodiscard]] Image astype(ImageType type) const;

 private:
  std::vector<std::size_t> shape_;
  ImageType type_{ImageType::Byte};
  std::vector<std::byte> buffer_;
};

}  // namespace imutil::core
