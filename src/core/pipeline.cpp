#include <sevclass/core/pipeline.hpp>
#include <chrono>
#include <utility>

namespace sevclass::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<ClassificationResult, ClassifyError> Pipeline::run(
    std::span<const std::byte> encoded,
    StageTimingCallback* timing_cb) const {
  return run_from(StagePayload{EncodedImage{encoded}}, timing_cb);
}

std::expected<ClassificationResult, ClassifyError> Pipeline::run(
    PixelBuffer pixels,
    StageTimingCallback* timing_cb) const {
  return run_from(StagePayload{std::move(pixels)}, timing_cb);
}

std::expected<ClassificationResult, ClassifyError> Pipeline::run_from(
    StagePayload current,
    StageTimingCallback* timing_cb) const {
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (auto* done = std::get_if<ClassificationResult>(&current)) {
      return std::move(*done);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(std::move(current));
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  if (auto* done = std::get_if<ClassificationResult>(&current)) {
    return std::move(*done);
  }
  return std::unexpected(ClassifyError::InvalidConfig);
}

}  // namespace sevclass::core
