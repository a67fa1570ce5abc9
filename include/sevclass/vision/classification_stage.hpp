#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline_stage.hpp>
#include <sevclass/vision/classifier.hpp>
#include <sevclass/vision/inference_backend.hpp>
#include <expected>
#include <memory>

namespace sevclass::vision {

/// Pipeline stage: run inference backend + classifier -> ClassificationResult.
/// Rejects non-finite tensors (InvalidInput) and score vectors whose length
/// does not match the label set (AdapterFailed).
class ClassificationStage : public core::IPipelineStage {
 public:
  ClassificationStage(std::unique_ptr<IInferenceBackend> backend,
                      Classifier classifier);

  [[nodiscard]] std::expected<core::StagePayload, core::ClassifyError>
  process(core::StagePayload input) override;

 private:
  std::unique_ptr<IInferenceBackend> backend_;
  Classifier classifier_;
};

}  // namespace sevclass::vision
