#include <sevclass/app/pipeline_runner.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

namespace sevclass::app {

ClassificationOutcome run_pipeline(const core::Pipeline& pipeline,
                                   std::span<const std::byte> encoded,
                                   StageTimingCallback* timing_cb) {
  return pipeline.run(encoded, timing_cb);
}

void run_pipeline_batch(const core::Pipeline& pipeline,
                        const std::vector<std::vector<std::byte>>& images,
                        OutcomeCallback callback) {
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

void run_pipeline_batch_parallel(const core::Pipeline& pipeline,
                                 const std::vector<std::vector<std::byte>>& images,
                                 OutcomeCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = images.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_pipeline_batch(pipeline, images, std::move(callback));
    return;
  }

  std::atomic<std::size_t> next_index{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t idx = next_index.fetch_add(1);
      if (idx >= n) break;
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

}  // namespace sevclass::app
