#include <sevclass/vision/resize_stage.hpp>
#include "pixel_buffer_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>

namespace sevclass::vision {

std::expected<core::PixelBuffer, core::ClassifyError> resize(
    core::PixelBuffer input,
    std::uint32_t target_width,
    std::uint32_t target_height,
    ResizeMode mode) {
  using core::ClassifyError;
  if (input.empty() || target_width == 0 || target_height == 0) {
    return std::unexpected(ClassifyError::ResizeFailed);
  }
  if (mode != ResizeMode::Stretch) {
    return std::unexpected(ClassifyError::ResizeFailed);
  }
  if (input.width() == target_width && input.height() == target_height) {
    return input;
  }

  try {
    const cv::Mat mat_in = detail::buffer_to_mat(input);
    cv::Mat mat_out;
    cv::resize(mat_in, mat_out,
               cv::Size(static_cast<int>(target_width),
                        static_cast<int>(target_height)),
               0, 0, cv::INTER_LINEAR);
    if (static_cast<std::uint32_t>(mat_out.cols) != target_width ||
        static_cast<std::uint32_t>(mat_out.rows) != target_height) {
      return std::unexpected(ClassifyError::ResizeFailed);
    }
    return detail::mat_to_buffer(mat_out);
  } catch (const cv::Exception&) {
    return std::unexpected(ClassifyError::ResizeFailed);
  }
}

ResizeStage::ResizeStage(std::uint32_t target_width,
                         std::uint32_t target_height,
                         ResizeMode mode)
    : target_width_(target_width), target_height_(target_height), mode_(mode) {}

std::expected<core::StagePayload, core::ClassifyError>
ResizeStage::process(core::StagePayload input) {
  auto* pixels = std::get_if<core::PixelBuffer>(&input);
  if (!pixels) {
    return std::unexpected(core::ClassifyError::InvalidInput);
  }
  auto out = resize(std::move(*pixels), target_width_, target_height_, mode_);
  if (!out) {
    return std::unexpected(out.error());
  }
  return core::StagePayload{std::move(*out)};
}

}  // namespace sevclass::vision
