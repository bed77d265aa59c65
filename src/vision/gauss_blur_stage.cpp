#include <imutil/vision/gauss_blur_stage.hpp>
#include <imutil/vision/gauss_blur.hpp>

namespace imutil::vision {

GaussBlurStage::GaussBlurStage(double sigma) : sigma_(sigma) {}

std::expected<imutil::core::Image, imutil::core::ImageError>
GaussBlurStage::process(const imutil::core::Image& input) const {
  return gauss_blur(input, sigma_);
}

}  // namespace imutil::vision
