#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/image_type.hpp>
#include <imutil/core/labeling.hpp>
#include <imutil/core/pipeline_stage.hpp>
#include <expected>
#include <memory>

namespace imutil::vision {

/// Renumbers labels onto 0..N without checking connectivity.
class ConsecutivelyNumberStage : public imutil::core::IPipelineStage {
 public:
  explicit ConsecutivelyNumberStage(imutil::core::ImageType widest = imutil::core::ImageType::ULong);

  [[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError>
  process(const imutil::core::Image& input) const override;

 private:
  imutil::core::ImageType widest_;
};

/// Renumbers labels and splits labels covering several connected regions.
/// Owns the component labeler (e.g. CvComponentLabeler).
class RelabelStage : public imutil::core::IPipelineStage {
 public:
  RelabelStage(std::unique_ptr<imutil::core::IComponentLabeler> labeler,
               imutil::core::ImageType widest = imutil::core::ImageType::ULong);

  [[nodiscard]] std::expected<imutil::core::Image, imutil::core::ImageError>
  process(const imutil::core::Image& input) const override;

 private:
  std::unique_ptr<imutil::core::IComponentLabeler> labeler_;
  imutil::core::ImageType widest_;
};

}  // namespace imutil::vision
