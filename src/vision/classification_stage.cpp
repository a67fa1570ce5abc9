#include <sevclass/vision/classification_stage.hpp>
#include <stdexcept>
#include <utility>

namespace sevclass::vision {

ClassificationStage::ClassificationStage(
    std::unique_ptr<IInferenceBackend> backend,
    Classifier classifier)
    : backend_(std::move(backend)),
      classifier_(std::move(classifier)) {
  if (!backend_) {
    throw std::invalid_argument("ClassificationStage: backend is required");
  }
}

std::expected<core::StagePayload, core::ClassifyError>
ClassificationStage::process(core::StagePayload input) {
  const auto* tensor = std::get_if<core::Tensor>(&input);
  if (!tensor || tensor->empty() || !tensor->all_finite()) {
    return std::unexpected(core::ClassifyError::InvalidInput);
  }
  auto valid = backend_->validate_input(*tensor);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto scores = backend_->infer(*tensor);
  if (!scores) {
    return std::unexpected(scores.error());
  }
  if (scores->size() != classifier_.labels().size()) {
    return std::unexpected(core::ClassifyError::AdapterFailed);
  }
  return core::StagePayload{classifier_.classify(*scores)};
}

}  // namespace sevclass::vision
