#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sevclass::core {

/// Memory order of the float data handed to the inference backend.
/// The trained model expects ChannelPlanar; a wrong layout gives wrong
/// predictions without any runtime error.
enum class TensorLayout : std::uint8_t {
  ChannelPlanar,  // NCHW: all R, then all G, then all B
  Interleaved,    // NHWC: R,G,B per pixel
};

/// Logical shape in NCHW terms, independent of the memory layout.
struct TensorShape {
  std::uint32_t batch{1};
  std::uint32_t channels{3};
  std::uint32_t height{0};
  std::uint32_t width{0};

  [[nodiscard]] std::size_t element_count() const noexcept {
    return static_cast<std::size_t>(batch) * channels * height * width;
  }
  /// Dimensions in the order the layout stores them, e.g. for ONNX tensor creation.
  [[nodiscard]] std::array<std::int64_t, 4> dims(TensorLayout layout) const noexcept;

  friend bool operator==(const TensorShape&, const TensorShape&) = default;
};

/// Float32 model input. Owns its data; move it into the next stage.
class Tensor {
 public:
  Tensor() = default;

  /// Zero-filled tensor of the given shape.
  Tensor(TensorShape shape, TensorLayout layout);

  /// Throws std::invalid_argument if data.size() != shape.element_count().
  Tensor(TensorShape shape, TensorLayout layout, std::vector<float> data);

  [[nodiscard]] const TensorShape& shape() const noexcept { return shape_; }
  [[nodiscard]] TensorLayout layout() const noexcept { return layout_; }

  [[nodiscard]] std::span<float> data() noexcept { return data_; }
  [[nodiscard]] std::span<const float> data() const noexcept { return data_; }

  [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

  /// Flat index of (c, y, x) in batch 0, honouring the layout.
  [[nodiscard]] std::size_t index(std::uint32_t c, std::uint32_t y, std::uint32_t x) const noexcept;

  [[nodiscard]] float at(std::uint32_t c, std::uint32_t y, std::uint32_t x) const noexcept {
    return data_[index(c, y, x)];
  }

  /// True if no element is NaN or infinite.
  [[nodiscard]] bool all_finite() const noexcept;

 private:
  TensorShape shape_{};
  TensorLayout layout_{TensorLayout::ChannelPlanar};
  std::vector<float> data_;
};

/// Raw per-class model output, one score per label. May contain NaN.
using ScoreVector = std::vector<float>;

}  // namespace sevclass::core
