#include <imutil/core/histogram.hpp>
#include <imutil/core/classify.hpp>
#include <imutil/core/element.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <numeric>
#include <type_traits>

namespace imutil::core {

namespace {

constexpr std::size_t kSourceBins = 256;

void accumulate_histogram(const ImageView& view, const ValueRange& range, Histogram& hist) {
  const auto [mn, mx] = range;
  const double upper = mx + 1.0;
  const double norm = static_cast<double>(hist.size()) / (upper - mn);
  view.for_each([&](auto v) {
    const double x = static_cast<double>(v);
    if (!(x >= mn && x <= upper)) return;
    const auto bin = static_cast<std::size_t>((x - mn) * norm);
    ++hist[std::min(bin, hist.size() - 1)];
  });
}

std::expected<std::vector<double>, ImageError> target_histogram(
    const Image& im, std::optional<std::size_t> nbins, const Image* hgram) {
  const auto total = static_cast<double>(im.element_count());
  if (hgram == nullptr) {
    const std::size_t bins = nbins.value_or(64);
    if (bins < 2) {
      return std::unexpected(ImageError::Argument);
    }
    return std::vector<double>(bins, total / static_cast<double>(bins));
  }
  if (nbins.has_value() || hgram->ndim() != 1 || hgram->type() == ImageType::Rgb24) {
    return std::unexpected(ImageError::Argument);
  }

  std::vector<double> h = hgram->values<double>();
  const double sum = std::accumulate(h.begin(), h.end(), 0.0);
  const bool negative = std::any_of(h.begin(), h.end(), [](double x) { return x < 0.0; });
  if (h.size() < 2 || negative || !(sum > 0.0)) {
    return std::unexpected(ImageError::Argument);
  }
  // Same shape, but the total must equal the pixel count.
  for (double& x : h) {
    x *= total / sum;
  }
  return h;
}

}  // namespace

std::expected<Histogram, ImageError> imhist(const Image& im, std::size_t nbins) {
  if (!is_plain_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  if (nbins == 0) {
    return std::unexpected(ImageError::Argument);
  }
  auto range = min_max(im);
  if (!range) {
    return std::unexpected(range.error());
  }
  Histogram hist(nbins, 0);
  accumulate_histogram(im.view(), *range, hist);
  return hist;
}

std::expected<Histogram, ImageError> imhist(std::span<const Image> images, std::size_t nbins) {
  Histogram total(nbins, 0);
  for (const Image& im : images) {
    auto h = imhist(im, nbins);
    if (!h) {
      return std::unexpected(h.error());
    }
    std::transform(total.begin(), total.end(), h->begin(), total.begin(), std::plus<>());
  }
  return total;
}

std::expected<Image, ImageError> histeq(const Image& im,
                                        std::optional<std::size_t> nbins,
                                        const Image* hgram) {
  if (!is_plain_image(im)) {
    return std::unexpected(ImageError::Classification);
  }
  auto h_dst = target_histogram(im, nbins, hgram);
  if (!h_dst) {
    return std::unexpected(h_dst.error());
  }
  const std::size_t bins = h_dst->size();

  // Signed data is binned by its unsigned bit pattern.
  const ImageType orig_type = im.type();
  const ImageType work_type = unsigned_counterpart(orig_type).value_or(orig_type);
  auto view = im.view_as(work_type);
  if (!view) {
    return std::unexpected(view.error());
  }
  auto range = is_float_type(work_type) ? min_max(im) : min_max(work_type);
  if (!range) {
    return std::unexpected(range.error());
  }
  const double mx = range->second;
  if (!(mx > 0.0)) {
    return std::unexpected(ImageError::UnsupportedValue);
  }

  Histogram h_src(kSourceBins, 0);
  accumulate_histogram(*view, *range, h_src);

  std::vector<double> h_src_cdf(kSourceBins);
  std::partial_sum(h_src.begin(), h_src.end(), h_src_cdf.begin());
  std::vector<double> h_dst_cdf(bins);
  std::partial_sum(h_dst->begin(), h_dst->end(), h_dst_cdf.begin());

  const auto total = static_cast<double>(im.element_count());
  const double limit = -total * std::sqrt(std::numeric_limits<double>::epsilon());
  const double scale = mx / static_cast<double>(bins - 1);

  // For each source bin, the first destination bin whose CDF error is smallest,
  // ignoring bins whose CDF falls clearly below the source CDF.
  std::array<double, kSourceBins> table{};
  for (std::size_t s = 0; s < kSourceBins; ++s) {
    const double tol = (s == 0 || s == kSourceBins - 1) ? 0.0 : static_cast<double>(h_src[s]) / 2.0;
    std::size_t best_bin = 0;
    double best_err = std::numeric_limits<double>::infinity();
    for (std::size_t d = 0; d < bins; ++d) {
      double err = h_dst_cdf[d] - h_src_cdf[s] + tol;
      if (err < limit) err = total;
      if (err < best_err) {
        best_err = err;
        best_bin = d;
      }
    }
    table[s] = std::nearbyint(static_cast<double>(best_bin) * scale);
  }

  Image out = Image::zeros(im.shape(), work_type);
  std::byte* dst = out.data().data();
  const std::size_t step = element_size(work_type);
  const bool exact_fit = mx == 255.0;
  detail::visit_scalar(work_type, [&](auto elem) {
    using V = typename decltype(elem)::value_type;
    std::array<V, kSourceBins> lut{};
    for (std::size_t s = 0; s < kSourceBins; ++s) {
      if constexpr (std::is_integral_v<V> && !std::is_same_v<V, bool>) {
        // uint64 max rounds up to 2^64 as a double.
        constexpr auto vmax = std::numeric_limits<V>::max();
        lut[s] = table[s] >= static_cast<double>(vmax) ? vmax : static_cast<V>(table[s]);
      } else {
        lut[s] = static_cast<V>(table[s]);
      }
    }
    std::size_t i = 0;
    view->for_each([&](auto v) {
      const double x = static_cast<double>(v);
      double idx = std::nearbyint(exact_fit ? x : x * (255.0 / mx));
      if (!(idx > 0.0)) idx = 0.0;
      if (idx > 255.0) idx = 255.0;
      elem.store(dst + i * step, lut[static_cast<std::size_t>(idx)]);
      ++i;
    });
  });
  return std::move(out).reinterpret(orig_type);
}

}  // namespace imutil::core
