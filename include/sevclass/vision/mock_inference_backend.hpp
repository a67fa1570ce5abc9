#pragma once

#include <sevclass/vision/inference_backend.hpp>
#include <atomic>
#include <cstddef>
#include <optional>

namespace sevclass::vision {

/// Mock backend that returns configurable scores (for tests/demo).
/// Configure before use; infer() may then be called from several threads.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Scores returned by every infer() call.
  void set_scores(core::ScoreVector scores);

  /// Make infer() fail with the given error; nullopt restores scores.
  void set_error(std::optional<core::ClassifyError> error);

  [[nodiscard]] std::expected<core::ScoreVector, core::ClassifyError>
  infer(const core::Tensor& input) override;

  [[nodiscard]] std::expected<void, core::ClassifyError>
  validate_input(const core::Tensor& input) const override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  core::ScoreVector scores_to_return_;
  std::optional<core::ClassifyError> error_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace sevclass::vision
