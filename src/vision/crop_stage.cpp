#include <imutil/vision/crop_stage.hpp>
#include <imutil/core/geometry.hpp>

namespace imutil::vision {

std::expected<imutil::core::Image, imutil::core::ImageError>
CropStage::process(const imutil::core::Image& input) const {
  return imutil::core::crop(input);
}

}  // namespace imutil::vision
