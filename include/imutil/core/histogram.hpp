#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace imutil::core {

using Histogram = std::vector<std::int64_t>;

/// Histogram of a plain image with nbins equal-width bins over [min, max + 1),
/// where (min, max) = min_max(im).
[[nodiscard]] std::expected<Histogram, ImageError> imhist(const Image& im, std::size_t nbins = 256);

/// Sum of the histograms of several images.
[[nodiscard]] std::expected<Histogram, ImageError> imhist(std::span<const Image> images,
                                                          std::size_t nbins = 256);

/// Histogram equalization of a plain image, either to a uniform histogram of
/// nbins bins (64 when neither argument is given) or to the 1-D target
/// histogram hgram. Giving both is an Argument error.
///
/// Signed integer images are equalized through their unsigned bit pattern
/// (no value conversion) and returned in the input element type.
[[nodiscard]] std::expected<Image, ImageError> histeq(const Image& im,
                                                      std::optional<std::size_t> nbins = std::nullopt,
                                                      const Image* hgram = nullptr);

}  // namespace imutil::core
