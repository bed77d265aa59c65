#include <imutil/app/pipeline_factory.hpp>
#include <imutil/core/labeling.hpp>
#include <imutil/vision/component_labeler.hpp>
#include <imutil/vision/crop_stage.hpp>
#include <imutil/vision/gauss_blur_stage.hpp>
#include <imutil/vision/histeq_stage.hpp>
#include <imutil/vision/relabel_stage.hpp>
#include <memory>

namespace imutil::app {

std::expected<imutil::core::Pipeline, imutil::core::ImageError> build_pipeline(
    const PipelineConfig& cfg) {
  using namespace imutil::vision;
  using imutil::core::ImageError;

  if (!imutil::core::label_type_for(0, cfg.max_label_type)) {
    return std::unexpected(ImageError::InvalidConfig);
  }

  imutil::core::Pipeline pipeline;
  for (const auto& op : cfg.ops) {
    if (op == "crop") {
      pipeline.add_stage(std::make_unique<CropStage>());
    } else if (op == "blur") {
      pipeline.add_stage(std::make_unique<GaussBlurStage>(cfg.blur_sigma));
    } else if (op == "histeq") {
      pipeline.add_stage(std::make_unique<HistEqStage>(cfg.nbins));
    } else if (op == "number") {
      pipeline.add_stage(std::make_unique<ConsecutivelyNumberStage>(cfg.max_label_type));
    } else if (op == "relabel") {
      pipeline.add_stage(std::make_unique<RelabelStage>(
          std::make_unique<CvComponentLabeler>(), cfg.max_label_type));
    } else {
      return std::unexpected(ImageError::InvalidConfig);
    }
  }
  return pipeline;
}

}  // namespace imutil::app
