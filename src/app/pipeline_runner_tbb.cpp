#include <sevclass/app/pipeline_runner_tbb.hpp>

#ifdef SEVCLASS_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace sevclass::app {

void run_pipeline_batch_tbb(const core::Pipeline& pipeline,
                            const std::vector<std::vector<std::byte>>& images,
                            OutcomeCallback callback) {
  if (images.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, images.size()),
      [&pipeline, &images, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          callback(i, pipeline.run(images[i]));
        }
      });
}

}  // namespace sevclass::app

#endif  // SEVCLASS_HAS_TBB
