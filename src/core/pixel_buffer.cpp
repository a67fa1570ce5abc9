#include <sevclass/core/pixel_buffer.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace sevclass::core {

PixelBuffer::PixelBuffer(std::uint32_t width,
                         std::uint32_t height,
                         std::vector<std::byte> buffer)
    : width_(width), height_(height), buffer_(std::move(buffer)) {
  if (buffer_.size() != min_bytes(width_, height_)) {
    throw std::invalid_argument(
        "PixelBuffer: expected " + std::to_string(min_bytes(width_, height_)) +
        " bytes for " + std::to_string(width_) + "x" + std::to_string(height_) +
        " RGBA, got " + std::to_string(buffer_.size()));
  }
}

PixelBuffer::PixelBuffer(PixelBuffer&& other) noexcept
    : width_(std::exchange(other.width_, 0)),
      height_(std::exchange(other.height_, 0)),
      buffer_(std::move(other.buffer_)) {
  other.buffer_.clear();
}

PixelBuffer& PixelBuffer::operator=(PixelBuffer&& other) noexcept {
  if (this != &other) {
    width_ = std::exchange(other.width_, 0);
    height_ = std::exchange(other.height_, 0);
    buffer_ = std::move(other.buffer_);
    other.buffer_.clear();
  }
  return *this;
}

}  // namespace sevclass::core
