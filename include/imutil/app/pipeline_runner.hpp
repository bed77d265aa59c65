#pragma once

#include <imutil/core/error.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace imutil::app {

using ImageResult = std::expected<imutil::core::Image, imutil::core::ImageError>;

/// Callback for each batch item: (index into the input vector, result).
/// Must be thread-safe if using run_pipeline_batch_parallel.
using ImageResultCallback = std::function<void(std::size_t index, const ImageResult& result)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = imutil::core::StageTimingCallback;

/// Runs pipeline on a single image. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
[[nodiscard]] ImageResult run_pipeline(const imutil::core::Pipeline& pipeline,
                                       const imutil::core::Image& image,
                                       StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple images sequentially; calls callback for each result, in order.
void run_pipeline_batch(const imutil::core::Pipeline& pipeline,
                        const std::vector<imutil::core::Image>& images,
                        const ImageResultCallback& callback);

/// Runs pipeline on multiple images using a pool of worker threads.
/// callback may be invoked from any worker (must be thread-safe), in any order.
/// num_workers 0 = use hardware concurrency.
void run_pipeline_batch_parallel(const imutil::core::Pipeline& pipeline,
                                 const std::vector<imutil::core::Image>& images,
                                 const ImageResultCallback& callback,
                                 std::size_t num_workers = 0);

}  // namespace imutil::app
