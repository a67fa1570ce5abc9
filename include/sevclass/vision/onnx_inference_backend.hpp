#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/tensor.hpp>
#include <sevclass/vision/inference_backend.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace sevclass::vision {

/// ONNX Runtime inference backend: loads an ONNX classification model and
/// implements IInferenceBackend.
///
/// Expected model: one float image input, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC),
/// and a float output that flattens to one score per class, e.g. [1,K] or [K].
/// Input/output names are configurable; if empty, the first input/output is used.
///
/// Input contract: Tensor layout and shape must match the model input exactly;
/// otherwise infer() fails with AdapterFailed. The tensor is handed to ONNX
/// Runtime without copying, and no per-call state is kept in the backend, so
/// infer() may be called concurrently.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_name Optional output tensor name; if empty, the first output is used.
  /// Throws Ort::Exception if the model cannot be loaded and std::runtime_error
  /// if its signature is not a single-image classifier.
  explicit OnnxInferenceBackend(std::string model_path,
                                std::string input_name = {},
                                std::string output_name = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<core::ScoreVector, core::ClassifyError>
  infer(const core::Tensor& input) override;

  [[nodiscard]] std::expected<void, core::ClassifyError>
  validate_input(const core::Tensor& input) const override;

  void warmup() override;

  /// Input shape and layout read from the model.
  [[nodiscard]] core::TensorShape input_shape() const noexcept;
  [[nodiscard]] core::TensorLayout input_layout() const noexcept;
  /// Number of scores per inference; 0 if the model leaves it dynamic.
  [[nodiscard]] std::size_t num_classes() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sevclass::vision
