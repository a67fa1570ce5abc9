#include <sevclass/vision/center_crop_normalize_stage.hpp>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace sevclass::vision {

namespace {

constexpr std::uint32_t kRgbChannels = 3;

float normalize_channel(std::byte value, float mean, float scale) {
  const float v = (static_cast<float>(std::to_integer<std::uint8_t>(value)) - mean) * scale;
  return std::isnan(v) ? 0.f : v;
}

}  // namespace

std::int64_t center_crop_offset(std::uint32_t extent, std::uint32_t crop) noexcept {
  const std::int64_t diff = static_cast<std::int64_t>(extent) - static_cast<std::int64_t>(crop);
  // Floor division, also for negative differences.
  return diff >= 0 ? diff / 2 : -((-diff + 1) / 2);
}

core::Tensor crop_normalize(const core::PixelBuffer& input,
                            const CropNormalizeConfig& config) {
  const std::uint32_t c = config.crop_size;
  core::Tensor tensor(core::TensorShape{1, kRgbChannels, c, c}, config.layout);
  if (c == 0) {
    return tensor;
  }

  const std::int64_t offset_x = center_crop_offset(input.width(), c);
  const std::int64_t offset_y = center_crop_offset(input.height(), c);
  const auto src = input.data();
  auto dst = tensor.data();

  for (std::uint32_t y = 0; y < c; ++y) {
    const std::int64_t src_y = static_cast<std::int64_t>(y) + offset_y;
    for (std::uint32_t x = 0; x < c; ++x) {
      const std::int64_t src_x = static_cast<std::int64_t>(x) + offset_x;
      // Out-of-bounds pixels stay 0 (the tensor is zero-initialized).
      if (src_x < 0 || src_y < 0 ||
          src_x >= static_cast<std::int64_t>(input.width()) ||
          src_y >= static_cast<std::int64_t>(input.height())) {
        continue;
      }
      const std::size_t i = input.offset(static_cast<std::uint32_t>(src_x),
                                         static_cast<std::uint32_t>(src_y));
      if (i + 2 >= src.size()) {
        continue;
      }
      for (std::uint32_t ch = 0; ch < kRgbChannels; ++ch) {
        dst[tensor.index(ch, y, x)] = normalize_channel(src[i + ch], config.mean, config.scale);
      }
    }
  }
  return tensor;
}

CenterCropNormalizeStage::CenterCropNormalizeStage(CropNormalizeConfig config)
    : config_(config) {
  if (config_.crop_size == 0) {
    throw std::invalid_argument("CenterCropNormalizeStage: crop_size must be > 0");
  }
}

std::expected<core::StagePayload, core::ClassifyError>
CenterCropNormalizeStage::process(core::StagePayload input) {
  const auto* pixels = std::get_if<core::PixelBuffer>(&input);
  if (!pixels || pixels->empty()) {
    return std::unexpected(core::ClassifyError::InvalidInput);
  }
  return core::StagePayload{crop_normalize(*pixels, config_)};
}

}  // namespace sevclass::vision
