#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline_stage.hpp>
#include <sevclass/core/pixel_buffer.hpp>
#include <cstdint>
#include <expected>

namespace sevclass::vision {

/// How the source is mapped onto the target size.
/// Stretch scales each axis independently: the aspect ratio is NOT kept and
/// there is no letterbox. The model was trained on stretched inputs.
enum class ResizeMode : std::uint8_t {
  Stretch,
};

/// Resizes to exactly target_width x target_height with bilinear interpolation.
/// Zero targets or an empty source give ResizeFailed.
[[nodiscard]] std::expected<core::PixelBuffer, core::ClassifyError> resize(
    core::PixelBuffer input,
    std::uint32_t target_width,
    std::uint32_t target_height,
    ResizeMode mode = ResizeMode::Stretch);

/// Resizes input buffer to a fixed size (the crop stage's working resolution).
class ResizeStage : public core::IPipelineStage {
 public:
  ResizeStage(std::uint32_t target_width,
              std::uint32_t target_height,
              ResizeMode mode = ResizeMode::Stretch);

  [[nodiscard]] std::expected<core::StagePayload, core::ClassifyError>
  process(core::StagePayload input) override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
  ResizeMode mode_;
};

}  // namespace sevclass::vision
