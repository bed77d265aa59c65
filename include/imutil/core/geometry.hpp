#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/rectangle.hpp>
#include <cstddef>
#include <expected>
#include <optional>

namespace imutil::core {

/// Foreground rectangle: rows and columns equal to the background value are
/// trimmed from each side. Without bg, the background is taken from the top-left
/// pixel if the first row or column is solid, else from the bottom-right pixel
/// if the last row or column is solid; otherwise the whole image is returned.
/// An explicit bg is only valid for plain images.
[[nodiscard]] std::expected<Rectangle, ImageError> get_foreground_area(
    const Image& im, std::optional<double> bg = std::nullopt);

/// In place: sets everything outside rect (default: get_foreground_area) to bg,
/// or, when mirror is set, reflects the foreground across each rectangle edge.
/// A reflection needs at least as much foreground as background on that side.
[[nodiscard]] std::expected<void, ImageError> fill_background(
    Image& im, std::optional<Rectangle> rect = std::nullopt, double bg = 0.0, bool mirror = false);

/// Copy of the (inclusive) rectangle; default rectangle from get_foreground_area.
[[nodiscard]] std::expected<Image, ImageError> crop(const Image& im,
                                                    std::optional<Rectangle> rect = std::nullopt);

/// Zero padding on each side.
[[nodiscard]] std::expected<Image, ImageError> pad(const Image& im,
                                                   std::size_t top,
                                                   std::size_t left,
                                                   std::size_t bottom,
                                                   std::size_t right);

/// Rows in reverse order.
[[nodiscard]] std::expected<Image, ImageError> flip_up_down(const Image& im);

}  // namespace imutil::core
