#include <sevclass/vision/inference_backend.hpp>
#include <utility>

namespace sevclass::vision {

std::expected<std::vector<core::ScoreVector>, core::ClassifyError>
IInferenceBackend::infer_batch(std::span<const core::Tensor> inputs) {
  std::vector<core::ScoreVector> results;
  results.reserve(inputs.size());
  for (const auto& tensor : inputs) {
    auto single = infer(tensor);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace sevclass::vision
