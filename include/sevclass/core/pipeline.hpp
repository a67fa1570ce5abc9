#pragma once

#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace sevclass::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes the payload through until a stage returns
/// a ClassificationResult.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one encoded image; returns the classification or the first error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process(), every run owns its buffers).
  [[nodiscard]] std::expected<ClassificationResult, ClassifyError> run(
      std::span<const std::byte> encoded,
      StageTimingCallback* timing_cb = nullptr) const;

  /// Run from an already decoded buffer; the decode stage passes it through.
  [[nodiscard]] std::expected<ClassificationResult, ClassifyError> run(
      PixelBuffer pixels,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::expected<ClassificationResult, ClassifyError> run_from(
      StagePayload current, StageTimingCallback* timing_cb) const;

  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace sevclass::core
