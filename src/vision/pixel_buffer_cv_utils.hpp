#pragma once

#include <sevclass/core/pixel_buffer.hpp>
#include <opencv2/core.hpp>

namespace sevclass::vision::detail {

/// Non-owning CV_8UC4 view of an RGBA buffer. Empty Mat for an empty buffer.
cv::Mat buffer_to_mat(const core::PixelBuffer& buffer);

/// Copies a CV_8UC4 RGBA Mat into a new PixelBuffer. Throws std::invalid_argument
/// for any other Mat type.
core::PixelBuffer mat_to_buffer(const cv::Mat& rgba);

}  // namespace sevclass::vision::detail
