#include <imutil/vision/histeq_stage.hpp>
#include <imutil/core/histogram.hpp>
#include <utility>

namespace imutil::vision {

HistEqStage::HistEqStage(std::size_t nbins) : nbins_(nbins) {}

HistEqStage::HistEqStage(imutil::core::Image hgram) : hgram_(std::move(hgram)) {}

std::expected<imutil::core::Image, imutil::core::ImageError>
HistEqStage::process(const imutil::core::Image& input) const {
  return imutil::core::histeq(input, nbins_, hgram_ ? &*hgram_ : nullptr);
}

}  // namespace imutil::vision
