#include <imutil/core/labeling.hpp>
#include <imutil/core/classify.hpp>
#include <imutil/core/element.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <type_traits>
#include <vector>

namespace imutil::core {

namespace {

constexpr std::array<ImageType, 5> kLabelTypes = {
    ImageType::Bit, ImageType::Byte, ImageType::UShort, ImageType::UInt, ImageType::ULong,
};

std::vector<std::size_t> plane_shape(const Image& im) { return {im.rows(), im.cols()}; }

template <typename T>
std::vector<std::uint64_t> ranks_of(const std::vector<T>& pixels, const std::vector<T>& sorted_values) {
  std::vector<std::uint64_t> ranks(pixels.size());
  for (std::size_t i = 0; i < pixels.size(); ++i) {
    if constexpr (std::is_floating_point_v<T>) {
      // NaN owns the trailing slot.
      if (std::isnan(pixels[i])) {
        ranks[i] = sorted_values.size() - 1;
        continue;
      }
    }
    const auto it = std::lower_bound(sorted_values.begin(), sorted_values.end(), pixels[i]);
    ranks[i] = static_cast<std::uint64_t>(it - sorted_values.begin());
  }
  return ranks;
}

std::expected<Labeling, ImageError> make_labeling(std::vector<std::size_t> shape,
                                                  const std::vector<std::uint64_t>& labels,
                                                  std::uint64_t max_label,
                                                  ImageType widest) {
  auto type = label_type_for(max_label, widest);
  if (!type) {
    return std::unexpected(type.error());
  }
  return Labeling{Image::from_values(std::move(shape), *type, labels), max_label};
}

std::expected<Labeling, ImageError> number_rgb(const Image& im, ImageType widest) {
  const std::size_t count = im.rows() * im.cols();
  const std::byte* p = im.data().data();
  std::vector<std::uint32_t> pixels(count);
  for (std::size_t i = 0; i < count; ++i, p += 3) {
    pixels[i] = (std::to_integer<std::uint32_t>(p[0]) << 16) |
                (std::to_integer<std::uint32_t>(p[1]) << 8) |
                std::to_integer<std::uint32_t>(p[2]);
  }

  std::vector<std::uint32_t> values = pixels;
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  if (values.empty() || values.front() != 0) {
    values.insert(values.begin(), 0);
  }
  return make_labeling(plane_shape(im), ranks_of(pixels, values), values.size() - 1, widest);
}

std::expected<Labeling, ImageError> number_plain(const Image& im, ImageType widest) {
  return detail::visit_scalar(im.type(), [&](auto elem) -> std::expected<Labeling, ImageError> {
    using V = typename decltype(elem)::value_type;
    using T = std::conditional_t<std::is_same_v<V, bool>, std::uint8_t, V>;
    std::vector<T> pixels = im.values<T>();

    std::vector<T> values = pixels;
    bool has_nan = false;
    if constexpr (std::is_floating_point_v<T>) {
      const auto nan_begin = std::remove_if(values.begin(), values.end(), [](T v) { return std::isnan(v); });
      has_nan = nan_begin != values.end();
      values.erase(nan_begin, values.end());
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    if constexpr (std::is_signed_v<T>) {
      if (!values.empty() && values.front() < T{0}) {
        return std::unexpected(ImageError::UnsupportedValue);
      }
    }
    if (values.empty() || values.front() != T{0}) {
      values.insert(values.begin(), T{0});
    }
    if (has_nan) {
      values.push_back(std::numeric_limits<T>::quiet_NaN());
    }
    const std::uint64_t n = values.size() - 1;

    if constexpr (!std::is_floating_point_v<T>) {
      if (static_cast<std::uint64_t>(values.back()) == n) {
        // Already 0..n: plain narrowing copy.
        std::vector<std::uint64_t> labels(pixels.begin(), pixels.end());
        return make_labeling(plane_shape(im), labels, n, widest);
      }
    }
    return make_labeling(plane_shape(im), ranks_of(pixels, values), n, widest);
  });
}

Image label_mask(const Image& labels, std::uint64_t label) {
  Image mask = Image::zeros(labels.shape(), ImageType::Bit);
  std::byte* out = mask.data().data();
  std::size_t i = 0;
  labels.view().for_each([&](auto v) {
    out[i++] = static_cast<std::uint64_t>(v) == label ? std::byte{1} : std::byte{0};
  });
  return mask;
}

}  // namespace

std::expected<ImageType, ImageError> label_type_for(std::uint64_t n, ImageType widest) {
  if (std::find(kLabelTypes.begin(), kLabelTypes.end(), widest) == kLabelTypes.end()) {
    return std::unexpected(ImageError::Argument);
  }
  for (ImageType type : kLabelTypes) {
    if (n <= label_capacity(type)) return type;
    if (type == widest) break;
  }
  return std::unexpected(ImageError::Overflow);
}

std::expected<Labeling, ImageError> consecutively_number(const Image& im, ImageType widest) {
  if (is_rgb24(im)) {
    return number_rgb(im, widest);
  }
  if (is_plain_image(im)) {
    return number_plain(im, widest);
  }
  return std::unexpected(ImageError::Classification);
}

std::expected<Labeling, ImageError> relabel(const Image& im,
                                            const IComponentLabeler& labeler,
                                            ImageType widest) {
  auto numbered = consecutively_number(im, widest);
  if (!numbered) {
    return numbered;
  }
  Image labels = std::move(numbered->image);
  std::uint64_t n = numbered->max_label;

  // Labels produced by a split are single regions already; only 1..N are checked.
  std::deque<std::uint64_t> pending;
  for (std::uint64_t i = 1; i <= n; ++i) {
    pending.push_back(i);
  }

  while (!pending.empty()) {
    const std::uint64_t label = pending.front();
    pending.pop_front();

    auto components = labeler.label(label_mask(labels, label));
    if (!components) {
      return std::unexpected(components.error());
    }
    if (components->labels.element_count() != labels.element_count()) {
      return std::unexpected(ImageError::Argument);
    }
    if (components->count <= 1) continue;

    const std::uint64_t needed = n + components->count - 1;
    if (needed > label_capacity(labels.type())) {
      auto wider = label_type_for(needed, widest);
      if (!wider) {
        return std::unexpected(wider.error());
      }
      labels = labels.astype(*wider);
    }

    const std::vector<std::int64_t> ids = components->labels.values<std::int64_t>();
    const std::size_t step = element_size(labels.type());
    std::byte* out = labels.data().data();
    detail::visit_scalar(labels.type(), [&](auto elem) {
      using V = typename decltype(elem)::value_type;
      for (std::size_t p = 0; p < ids.size(); ++p) {
        if (ids[p] >= 2) {
          elem.store(out + p * step, static_cast<V>(n + static_cast<std::uint64_t>(ids[p]) - 1));
        }
      }
    });
    n = needed;
  }
  return Labeling{std::move(labels), n};
}

}  // namespace imutil::core
