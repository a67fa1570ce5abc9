#pragma once

#include <sevclass/app/pipeline_runner.hpp>
#include <sevclass/core/pipeline.hpp>
#include <cstddef>
#include <vector>

#ifdef SEVCLASS_HAS_TBB

namespace sevclass::app {

/// Runs the pipeline on a batch of encoded images in parallel using TBB.
///
/// Every image is processed in its own task with its own buffers; callback(index, outcome)
/// is invoked once per image, for failures too, from TBB worker threads (must be thread-safe).
/// The pipeline's backend must support concurrent infer() calls (ONNX and mock do).
///
/// \param pipeline Shared, read-only pipeline. Caller keeps ownership.
/// \param images Encoded JPEG images; not modified.
void run_pipeline_batch_tbb(const core::Pipeline& pipeline,
                            const std::vector<std::vector<std::byte>>& images,
                            OutcomeCallback callback);

}  // namespace sevclass::app

#endif  // SEVCLASS_HAS_TBB
