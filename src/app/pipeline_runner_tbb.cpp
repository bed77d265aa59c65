#include <imutil/app/pipeline_runner_tbb.hpp>

#ifdef IMUTIL_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace imutil::app {

void run_pipeline_batch_tbb(const imutil::core::Pipeline& pipeline,
                            const std::vector<imutil::core::Image>& images,
                            const ImageResultCallback& callback) {
  if (images.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, images.size()),
      [&pipeline, &images, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          callback(i, pipeline.run(images[i]));
        }
      });
}

}  // namespace imutil::app

#endif  // IMUTIL_HAS_TBB
