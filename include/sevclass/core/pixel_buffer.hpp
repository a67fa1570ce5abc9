#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sevclass::core {

/// Memory: PixelBuffer owns a single contiguous RGBA8 buffer (std::vector<std::byte>).
/// It is move-only: a stage hands its buffer to the next one, nothing is shared.
/// Thread-safety: distinct PixelBuffer instances are independent.

/// Decoded image: width, height and interleaved R,G,B,A bytes, row-major.
class PixelBuffer {
 public:
  static constexpr std::size_t kChannels = 4;

  PixelBuffer() = default;

  /// Throws std::invalid_argument unless buffer.size() == min_bytes(width, height).
  PixelBuffer(std::uint32_t width, std::uint32_t height, std::vector<std::byte> buffer);

  PixelBuffer(const PixelBuffer&) = delete;
  PixelBuffer& operator=(const PixelBuffer&) = delete;
  PixelBuffer(PixelBuffer&& other) noexcept;
  PixelBuffer& operator=(PixelBuffer&& other) noexcept;
  ~PixelBuffer() = default;

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Byte offset of pixel (x, y); caller checks bounds.
  [[nodiscard]] std::size_t offset(std::uint32_t x, std::uint32_t y) const noexcept {
    return (static_cast<std::size_t>(y) * width_ + x) * kChannels;
  }

  /// Bytes required for an RGBA8 image of the given dimensions.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width, std::uint32_t height) noexcept {
    return static_cast<std::size_t>(width) * height * kChannels;
  }

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::vector<std::byte> buffer_;
};

}  // namespace sevclass::core
