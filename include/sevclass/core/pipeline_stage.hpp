#pragma once

#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <sevclass/core/pixel_buffer.hpp>
#include <sevclass/core/tensor.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <variant>

namespace sevclass::core {

/// Compressed image bytes as supplied by the caller. Non-owning; valid for one run().
struct EncodedImage {
  std::span<const std::byte> bytes;
};

/// Value flowing between stages. Each stage takes ownership of its input
/// and returns the next payload; the pipeline stops at a ClassificationResult.
using StagePayload = std::variant<EncodedImage, PixelBuffer, Tensor, ClassificationResult>;

/// Abstract pipeline stage.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StagePayload, ClassifyError> process(
      StagePayload input) = 0;
};

}  // namespace sevclass::core
