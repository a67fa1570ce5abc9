#include <sevclass/core/tensor.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sevclass::core {

std::array<std::int64_t, 4> TensorShape::dims(TensorLayout layout) const noexcept {
  if (layout == TensorLayout::Interleaved) {
    return {batch, height, width, channels};
  }
  return {batch, channels, height, width};
}

Tensor::Tensor(TensorShape shape, TensorLayout layout)
    : shape_(shape), layout_(layout), data_(shape.element_count(), 0.f) {}

Tensor::Tensor(TensorShape shape, TensorLayout layout, std::vector<float> data)
    : shape_(shape), layout_(layout), data_(std::move(data)) {
  if (data_.size() != shape_.element_count()) {
    throw std::invalid_argument("Tensor: data size does not match shape");
  }
}

std::size_t Tensor::index(std::uint32_t c, std::uint32_t y, std::uint32_t x) const noexcept {
  const std::size_t w = shape_.width;
  const std::size_t h = shape_.height;
  if (layout_ == TensorLayout::Interleaved) {
    return (static_cast<std::size_t>(y) * w + x) * shape_.channels + c;
  }
  return static_cast<std::size_t>(c) * h * w + static_cast<std::size_t>(y) * w + x;
}

bool Tensor::all_finite() const noexcept {
  return std::all_of(data_.begin(), data_.end(),
                     [](float v) { return std::isfinite(v); });
}

}  // namespace sevclass::core
