#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <optional>

namespace imutil::vision {

/// Histogram equalization, to a uniform histogram of nbins bins or to a target histogram.
class HistEqStage : public imutil::core::IPipelineStage {
 public:
  explicit HistEqStage(std::size_t nbins = 64);
  /// hgram: 1-D target histogram.
  explicit HistEqStage(imutil::core::Image hgram);

  [[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError>
  process(const imutil::core::Image& input) const override;

 private:
  std::optional<std::size_t> nbins_;
  std::optional<imutil::core::Image> hgram_;
};

}  // namespace imutil::vision
