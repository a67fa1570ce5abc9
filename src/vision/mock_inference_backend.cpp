#include <sevclass/vision/mock_inference_backend.hpp>
#include <utility>

namespace sevclass::vision {

void MockInferenceBackend::set_scores(core::ScoreVector scores) {
  scores_to_return_ = std::move(scores);
}

void MockInferenceBackend::set_error(std::optional<core::ClassifyError> error) {
  error_ = error;
}

std::expected<core::ScoreVector, core::ClassifyError>
MockInferenceBackend::infer(const core::Tensor& input) {
  calls_.fetch_add(1);
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (error_) {
    return std::unexpected(*error_);
  }
  return scores_to_return_;
}

std::expected<void, core::ClassifyError>
MockInferenceBackend::validate_input(const core::Tensor& input) const {
  if (input.empty()) {
    return std::unexpected(core::ClassifyError::AdapterFailed);
  }
  return {};
}

}  // namespace sevclass::vision
