#pragma once

#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <vector>

namespace sevclass::app {

/// Outcome of one image: a classification (possibly InvalidPrediction) or an error.
using ClassificationOutcome = std::expected<core::ClassificationResult, core::ClassifyError>;

/// Callback for each image's outcome with its index in the input batch.
/// Called for failures too. Must be thread-safe if using run_pipeline_batch_parallel.
using OutcomeCallback =
    std::function<void(std::size_t index, const ClassificationOutcome& outcome)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = core::StageTimingCallback;

/// Runs pipeline on a single encoded image. No threading; direct call.
[[nodiscard]] ClassificationOutcome run_pipeline(const core::Pipeline& pipeline,
                                                 std::span<const std::byte> encoded,
                                                 StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple images sequentially; calls callback for each outcome in order.
void run_pipeline_batch(const core::Pipeline& pipeline,
                        const std::vector<std::vector<std::byte>>& images,
                        OutcomeCallback callback);

/// Runs pipeline on multiple images in parallel using a thread pool.
/// Pipeline::run() is called from worker threads; callback may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_pipeline_batch_parallel(const core::Pipeline& pipeline,
                                 const std::vector<std::vector<std::byte>>& images,
                                 OutcomeCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace sevclass::app
