#pragma once

#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline_stage.hpp>
#include <sevclass/core/pixel_buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

namespace sevclass::vision {

/// Frame header of a JPEG stream, as found by inspect_jpeg().
struct JpegInfo {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::uint8_t components{0};  // 1 = grayscale, 3 = YCbCr, 4 = CMYK/YCCK
  bool progressive{false};
};

/// Walks the marker structure of a JPEG stream without decoding pixels.
/// Requires SOI, well-formed segments, a SOF0/SOF1/SOF2 frame header before the
/// first SOS and an EOI after the scan data. Anything else is DecodeFailed.
[[nodiscard]] std::expected<JpegInfo, core::ClassifyError> inspect_jpeg(
    std::span<const std::byte> bytes);

/// Decodes a JPEG stream to RGBA. Validates structure first; never returns a
/// partially decoded buffer for truncated input.
[[nodiscard]] std::expected<core::PixelBuffer, core::ClassifyError> decode_jpeg(
    std::span<const std::byte> bytes);

/// Pipeline stage: EncodedImage -> PixelBuffer. An already decoded PixelBuffer
/// is passed through unchanged.
class DecodeStage : public core::IPipelineStage {
 public:
  [[nodiscard]] std::expected<core::StagePayload, core::ClassifyError>
  process(core::StagePayload input) override;
};

}  // namespace sevclass::vision
