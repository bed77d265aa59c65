#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <expected>

namespace imutil::vision {

/// Crops to the automatically detected foreground area.
class CropStage : public imutil::core::IPipelineStage {
 public:
  [[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError>
  process(const imutil::core::Image& input) const override;
};

}  // namespace imutil::vision
