#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/tensor.hpp>
#include <expected>
#include <span>
#include <vector>

namespace sevclass::vision {

/// Abstract inference backend: Tensor -> ScoreVector (one raw score per class).
/// A constructed backend is a ready backend; there is no separate "loaded" flag.
/// Implement infer(); optionally override validate_input, infer_batch, warmup.
/// Every failure is reported as ClassifyError::AdapterFailed, never as zeros.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-tensor inference. Must be implemented.
  [[nodiscard]] virtual std::expected<core::ScoreVector, core::ClassifyError>
  infer(const core::Tensor& input) = 0;

  /// Optional: validate tensor shape/layout before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, core::ClassifyError>
  validate_input(const core::Tensor& /*input*/) const {
    return {};
  }

  /// Optional: batch inference. Default: loop over infer().
  [[nodiscard]] virtual std::expected<std::vector<core::ScoreVector>, core::ClassifyError>
  infer_batch(std::span<const core::Tensor> inputs);

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace sevclass::vision
