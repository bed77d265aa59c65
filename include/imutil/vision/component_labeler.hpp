#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/labeling.hpp>
#include <expected>

namespace imutil::vision {

/// Connected components with cv::connectedComponents, 4-neighbour adjacency.
/// Stateless; safe to share across threads.
class CvComponentLabeler : public imutil::core::IComponentLabeler {
 public:
  /// Components of the non-zero pixels of a plain 2-D mask.
  [[nodiscard]] std::expected<imutil::core::Components, imutil::core::ImageError>
  label(const imutil::core::Image& mask) const override;
};

/// Connected-components analysis of a plain image: every non-zero pixel is
/// foreground, grouped into consecutively numbered 4-connected regions.
[[nodiscard]] std::expected<imutil::core::Components, imutil::core::ImageError>
label(const imutil::core::Image& im);

}  // namespace imutil::vision
