#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <expected>

namespace imutil::vision {

/// Gaussian blur with a fixed sigma.
class GaussBlurStage : public imutil::core::IPipelineStage {
 public:
  explicit GaussBlurStage(double sigma);

  [[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError>
  process(const imutil::core::Image& input) const override;

 private:
  double sigma_;
};

}  // namespace imutil::vision
