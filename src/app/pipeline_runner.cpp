#include <imutil/app/pipeline_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace imutil::app {

ImageResult run_pipeline(const imutil::core::Pipeline& pipeline,
                         const imutil::core::Image& image,
                         StageTimingCallback* timing_cb) {
  return pipeline.run(image, timing_cb);
}

void run_pipeline_batch(const imutil::core::Pipeline& pipeline,
                        const std::vector<imutil::core::Image>& images,
                        const ImageResultCallback& callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < images.size(); ++i) {
    callback(i, pipeline.run(images[i]));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_pipeline_batch_parallel(const imutil::core::Pipeline& pipeline,
                                 const std::vector<imutil::core::Image>& images,
                                 const ImageResultCallback& callback,
                                 std::size_t num_workers) {
  const std::size_t n = images.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_pipeline_batch(pipeline, images, callback);
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, pipeline.run(images[idx]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace imutil::app
