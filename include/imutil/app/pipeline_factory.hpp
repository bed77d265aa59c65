#pragma once

#include <imutil/app/config.hpp>
#include <imutil/core/error.hpp>
#include <imutil/core/pipeline.hpp>
#include <expected>

namespace imutil::app {

/// Builds the stage sequence named by cfg.ops. InvalidConfig for an unknown
/// operation or a max_label_type that is not an unsigned label type.
[[nodiscard]] std::expected<imutil::core::Pipeline, imutil::core::ImageError> build_pipeline(
    const PipelineConfig& cfg);

}  // namespace imutil::app
