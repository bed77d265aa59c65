#pragma once

#include <imutil/app/pipeline_runner.hpp>
#include <imutil/core/image.hpp>
#include <imutil/core/pipeline.hpp>
#include <vector>

#ifdef IMUTIL_HAS_TBB

namespace imutil::app {

/// Runs the pipeline on every image in parallel using TBB (tbb::parallel_for).
///
/// The same pipeline is invoked from TBB worker threads concurrently; stages are
/// read-only during process(), so this is safe for every stage in this library.
///
/// \param images Read only; not modified.
/// \param callback Invoked once per image with (index, result). Must be thread-safe.
void run_pipeline_batch_tbb(const imutil::core::Pipeline& pipeline,
                            const std::vector<imutil::core::Image>& images,
                            const ImageResultCallback& callback);

}  // namespace imutil::app

#endif  // IMUTIL_HAS_TBB
