#include <sevclass/vision/jpeg_decoder.hpp>
#include "pixel_buffer_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <optional>
#include <utility>

namespace sevclass::vision {

namespace {

using core::ClassifyError;

constexpr std::uint8_t kMarkerPrefix = 0xFF;
constexpr std::uint8_t kSoi = 0xD8;
constexpr std::uint8_t kEoi = 0xD9;
constexpr std::uint8_t kSos = 0xDA;
constexpr std::uint8_t kSof0 = 0xC0;  // baseline
constexpr std::uint8_t kSof1 = 0xC1;  // extended sequential
constexpr std::uint8_t kSof2 = 0xC2;  // progressive
constexpr std::uint8_t kDht = 0xC4;
constexpr std::uint8_t kJpg = 0xC8;
constexpr std::uint8_t kDac = 0xCC;
constexpr std::uint8_t kTem = 0x01;

bool is_rst(std::uint8_t m) { return m >= 0xD0 && m <= 0xD7; }

/// SOF3, SOF5-7, SOF9-11, SOF13-15: lossless, hierarchical or arithmetic frames.
bool is_unsupported_sof(std::uint8_t m) {
  return m >= 0xC3 && m <= 0xCF && m != kDht && m != kJpg && m != kDac;
}

class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> bytes) : bytes_(bytes) {}

  [[nodiscard]] std::size_t pos() const { return pos_; }
  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - pos_; }
  [[nodiscard]] std::uint8_t at(std::size_t i) const {
    return std::to_integer<std::uint8_t>(bytes_[i]);
  }
  std::optional<std::uint8_t> u8() {
    if (remaining() < 1) return std::nullopt;
    return at(pos_++);
  }
  std::optional<std::uint16_t> u16() {
    if (remaining() < 2) return std::nullopt;
    const auto v = static_cast<std::uint16_t>((at(pos_) << 8) | at(pos_ + 1));
    pos_ += 2;
    return v;
  }
  void seek(std::size_t p) { pos_ = p; }

 private:
  std::span<const std::byte> bytes_;
  std::size_t pos_{0};
};

/// Skips entropy-coded data after a SOS header. Leaves the reader on the 0xFF of
/// the next real marker. False if the stream ends first.
bool skip_scan_data(ByteReader& r) {
  while (r.remaining() >= 2) {
    const std::size_t p = r.pos();
    if (r.at(p) != kMarkerPrefix) {
      r.seek(p + 1);
      continue;
    }
    const std::uint8_t next = r.at(p + 1);
    if (next == 0x00 || is_rst(next) || next == kMarkerPrefix) {
      // Stuffed byte, restart marker or fill byte: still scan data.
      r.seek(p + 1);
      continue;
    }
    return true;
  }
  return false;
}

}  // namespace

std::expected<JpegInfo, core::ClassifyError> inspect_jpeg(std::span<const std::byte> bytes) {
  ByteReader r(bytes);
  const auto b0 = r.u8();
  const auto b1 = r.u8();
  if (!b0 || !b1 || *b0 != kMarkerPrefix || *b1 != kSoi) {
    return std::unexpected(ClassifyError::DecodeFailed);
  }

  std::optional<JpegInfo> info;
  bool seen_scan = false;
  while (true) {
    auto prefix = r.u8();
    if (!prefix || *prefix != kMarkerPrefix) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }
    std::optional<std::uint8_t> marker = r.u8();
    while (marker && *marker == kMarkerPrefix) marker = r.u8();  // fill bytes
    if (!marker) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }

    if (*marker == kEoi) {
      if (!info || !seen_scan) {
        return std::unexpected(ClassifyError::DecodeFailed);
      }
      return *info;
    }
    if (*marker == kSoi || *marker == 0x00) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }
    if (*marker == kTem || is_rst(*marker)) {
      continue;
    }
    if (is_unsupported_sof(*marker)) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }

    const std::size_t segment_start = r.pos();
    const auto length = r.u16();
    if (!length || *length < 2 || r.remaining() < static_cast<std::size_t>(*length) - 2) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }
    const std::size_t segment_end = segment_start + *length;

    if (*marker == kSof0 || *marker == kSof1 || *marker == kSof2) {
      if (info) {
        return std::unexpected(ClassifyError::DecodeFailed);  // one frame per image
      }
      const auto precision = r.u8();
      const auto height = r.u16();
      const auto width = r.u16();
      const auto components = r.u8();
      if (!precision || !height || !width || !components || *height == 0 || *width == 0) {
        return std::unexpected(ClassifyError::DecodeFailed);
      }
      if (*components != 1 && *components != 3 && *components != 4) {
        return std::unexpected(ClassifyError::DecodeFailed);
      }
      if (segment_end - segment_start < 8u + 3u * *components) {
        return std::unexpected(ClassifyError::DecodeFailed);
      }
      info = JpegInfo{*width, *height, *components, *marker == kSof2};
    }

    r.seek(segment_end);

    if (*marker == kSos) {
      if (!info) {
        return std::unexpected(ClassifyError::DecodeFailed);
      }
      seen_scan = true;
      if (!skip_scan_data(r)) {
        return std::unexpected(ClassifyError::DecodeFailed);  // truncated
      }
    }
  }
}

std::expected<core::PixelBuffer, core::ClassifyError> decode_jpeg(
    std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return std::unexpected(ClassifyError::DecodeFailed);
  }
  auto info = inspect_jpeg(bytes);
  if (!info) {
    return std::unexpected(info.error());
  }

  try {
    const cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1,
                          const_cast<std::byte*>(bytes.data()));
    // Pixel order as stored: EXIF orientation is not applied.
    cv::Mat bgr = cv::imdecode(encoded, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    if (bgr.empty() || bgr.type() != CV_8UC3) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }
    if (static_cast<std::uint32_t>(bgr.cols) != info->width ||
        static_cast<std::uint32_t>(bgr.rows) != info->height) {
      return std::unexpected(ClassifyError::DecodeFailed);
    }
    cv::Mat rgba;
    cv::cvtColor(bgr, rgba, cv::COLOR_BGR2RGBA);
    return detail::mat_to_buffer(rgba);
  } catch (const cv::Exception&) {
    return std::unexpected(ClassifyError::DecodeFailed);
  }
}

std::expected<core::StagePayload, core::ClassifyError>
DecodeStage::process(core::StagePayload input) {
  if (std::holds_alternative<core::PixelBuffer>(input)) {
    return input;
  }
  const auto* encoded = std::get_if<core::EncodedImage>(&input);
  if (!encoded) {
    return std::unexpected(ClassifyError::InvalidInput);
  }
  auto pixels = decode_jpeg(encoded->bytes);
  if (!pixels) {
    return std::unexpected(pixels.error());
  }
  return core::StagePayload{std::move(*pixels)};
}

}  // namespace sevclass::vision
