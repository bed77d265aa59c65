#include <imutil/vision/relabel_stage.hpp>
#include <stdexcept>
#include <utility>

namespace imutil::vision {

namespace ic = imutil::core;

ConsecutivelyNumberStage::ConsecutivelyNumberStage(ic::ImageType widest) : widest_(widest) {}

std::expected<ic::Image, ic::ImageError>
ConsecutivelyNumberStage::process(const ic::Image& input) const {
  auto numbered = ic::consecutively_number(input, widest_);
  if (!numbered) {
    return std::unexpected(numbered.error());
  }
  return std::move(numbered->image);
}

RelabelStage::RelabelStage(std::unique_ptr<ic::IComponentLabeler> labeler, ic::ImageType widest)
    : labeler_(std::move(labeler)), widest_(widest) {
  if (!labeler_) {
    throw std::invalid_argument("RelabelStage: labeler is required");
  }
}

std::expected<ic::Image, ic::ImageError>
RelabelStage::process(const ic::Image& input) const {
  auto relabeled = ic::relabel(input, *labeler_, widest_);
  if (!relabeled) {
    return std::unexpected(relabeled.error());
  }
  return std::move(relabeled->image);
}

}  // namespace imutil::vision
