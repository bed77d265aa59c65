#pragma once

#include <imutil/core/classify.hpp>
#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <expected>
#include <optional>

namespace imutil::core {

/// Black and white (Bit) image of a plain image.
/// threshold > 0: pixels >= threshold are white; otherwise pixels < -threshold
/// are white (so 0 gives an all-black image).
[[nodiscard]] std::expected<Image, ImageError> bw(const Image& im, double threshold = 1.0);

/// Float image linearly mapping in_scale (default min_max(im)) onto out_scale.
/// Not defined for Rgb24 records; both ranges need lower < upper.
[[nodiscard]] std::expected<Image, ImageError> float_image(
    const Image& im,
    std::optional<ValueRange> in_scale = std::nullopt,
    ValueRange out_scale = {0.0, 1.0});

}  // namespace imutil::core
