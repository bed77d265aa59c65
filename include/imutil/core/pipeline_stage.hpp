#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <expected>

namespace imutil::core {

/// Abstract pipeline stage: process one Image, return the transformed Image or an error.
/// Stages must not modify their own state in process() so a Pipeline can be shared across threads.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<Image, ImageError> process(const Image& input) const = 0;
};

}  // namespace imutil::core
