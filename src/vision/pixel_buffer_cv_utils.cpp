#include "pixel_buffer_cv_utils.hpp"
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace sevclass::vision::detail {

namespace sc = sevclass::core;

cv::Mat buffer_to_mat(const sc::PixelBuffer& buffer) {
  if (buffer.empty()) return cv::Mat();
  return cv::Mat(static_cast<int>(buffer.height()), static_cast<int>(buffer.width()),
                 CV_8UC4, const_cast<std::byte*>(buffer.data().data()));
}

sc::PixelBuffer mat_to_buffer(const cv::Mat& rgba) {
  if (rgba.type() != CV_8UC4) {
    throw std::invalid_argument("mat_to_buffer: expected CV_8UC4");
  }
  const auto w = static_cast<std::uint32_t>(rgba.cols);
  const auto h = static_cast<std::uint32_t>(rgba.rows);
  std::vector<std::byte> buffer(sc::PixelBuffer::min_bytes(w, h));
  const std::size_t row_bytes = static_cast<std::size_t>(w) * sc::PixelBuffer::kChannels;
  for (int y = 0; y < rgba.rows; ++y) {
    std::memcpy(buffer.data() + static_cast<std::size_t>(y) * row_bytes, rgba.ptr(y), row_bytes);
  }
  return sc::PixelBuffer(w, h, std::move(buffer));
}

}  // namespace sevclass::vision::detail
