#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/image_type.hpp>
#include <cstdint>
#include <expected>

namespace imutil::core {

/// Dense label image (values 0..max_label, 0 = background) and its max label.
struct Labeling {
  Image image;
  std::uint64_t max_label{0};
};

/// Connected components of a mask: same-shape Int labels (0 = outside the mask,
/// 1..count numbered in raster order) and the component count.
struct Components {
  Image labels;
  std::uint64_t count{0};
};

/// Connected-components primitive over a Bit mask, 4-neighbour adjacency.
class IComponentLabeler {
 public:
  virtual ~IComponentLabeler() = default;

  [[nodiscard]] virtual std::expected<Components, ImageError> label(const Image& mask) const = 0;
};

/// Narrowest of Bit, Byte, UShort, UInt, ULong (up to and including `widest`)
/// that can hold label n. Overflow if none; Argument if `widest` is not one of them.
[[nodiscard]] std::expected<ImageType, ImageError> label_type_for(
    std::uint64_t n, ImageType widest = ImageType::ULong);

/// Renumbers an RGB or plain image onto 0..N preserving value order; only 0
/// (or RGB 0,0,0) becomes 0. Negative values are UnsupportedValue.
[[nodiscard]] std::expected<Labeling, ImageError> consecutively_number(
    const Image& im, ImageType widest = ImageType::ULong);

/// Renumbers, then splits every label covering more than one connected region:
/// the first region keeps the label, the others get new labels above N.
/// The label type is widened (up to `widest`) when N outgrows it.
[[nodiscard]] std::expected<Labeling, ImageError> relabel(
    const Image& im, const IComponentLabeler& labeler, ImageType widest = ImageType::ULong);

}  // namespace imutil::core
