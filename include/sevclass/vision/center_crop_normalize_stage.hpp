#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline_stage.hpp>
#include <sevclass/core/pixel_buffer.hpp>
#include <sevclass/core/tensor.hpp>
#include <cstdint>
#include <expected>

namespace sevclass::vision {

/// Crop and normalization parameters. value = (pixel - mean) * scale.
struct CropNormalizeConfig {
  std::uint32_t crop_size{224};
  float mean{0.f};
  float scale{1.f / 255.f};
  core::TensorLayout layout{core::TensorLayout::ChannelPlanar};
};

/// Top-left corner of a centered crop: floor((extent - crop) / 2).
/// Negative when the crop is larger than the source.
[[nodiscard]] std::int64_t center_crop_offset(std::uint32_t extent,
                                              std::uint32_t crop) noexcept;

/// Extracts a crop_size x crop_size centered region and converts it to a
/// [1, 3, C, C] float tensor. Alpha is ignored. Destination pixels whose source
/// falls outside the buffer are 0 in all channels; NaN values are written as 0.
[[nodiscard]] core::Tensor crop_normalize(const core::PixelBuffer& input,
                                          const CropNormalizeConfig& config);

/// Pipeline stage: PixelBuffer -> Tensor.
class CenterCropNormalizeStage : public core::IPipelineStage {
 public:
  /// Throws std::invalid_argument if config.crop_size is 0.
  explicit CenterCropNormalizeStage(CropNormalizeConfig config);

  [[nodiscard]] std::expected<core::StagePayload, core::ClassifyError>
  process(core::StagePayload input) override;

 private:
  CropNormalizeConfig config_;
};

}  // namespace sevclass::vision
