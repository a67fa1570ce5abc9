#pragma once

#include <sevclass/app/config.hpp>
#include <sevclass/core/pipeline.hpp>
#include <sevclass/vision/inference_backend.hpp>
#include <memory>

namespace sevclass::app {

/// Decode -> resize (stretch) -> center crop + normalize -> classify.
/// The backend must be ready; the pipeline takes ownership of it.
/// Throws std::invalid_argument if validate_config() rejects the config.
[[nodiscard]] core::Pipeline build_pipeline(const PipelineConfig& config,
                                            std::unique_ptr<vision::IInferenceBackend> backend);

/// Creates the backend named by config.backend_type. For onnx the model is
/// loaded and warmed up; the crop size and layout must match its input.
/// Mock backends return uniform scores until configured otherwise.
[[nodiscard]] std::unique_ptr<vision::IInferenceBackend> make_backend(const PipelineConfig& config);

}  // namespace sevclass::app
