#pragma once

#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace sevclass::app {

/// Inference backend type: mock (fixed scores) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Pipeline configuration: model, preprocessing geometry, normalization, labels.
struct PipelineConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::string input_name;   // empty = first model input
  std::string output_name;  // empty = first model output
  std::uint32_t resize_width{256};
  std::uint32_t resize_height{256};
  std::uint32_t crop_size{224};
  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};
  core::LabelSet labels = core::default_labels();
};

/// Load config from a simple key=value file (one per line, '#' comments) or use defaults.
/// A missing file yields the defaults. Malformed or negative numbers, sizes above
/// INT_MAX and an unknown backend_type throw std::invalid_argument.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// Rejects zero sizes, sizes above INT_MAX, a crop larger than the resize target, empty labels,
/// and onnx without a model path.
[[nodiscard]] std::expected<void, core::ClassifyError> validate_config(const PipelineConfig& config);

}  // namespace sevclass::app
