#pragma once

#include <string_view>

namespace sevclass::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
/// A NaN model output is not an error: see InvalidPrediction.
enum class ClassifyError {
  None = 0,
  DecodeFailed,   // malformed or non-JPEG bytes
  ResizeFailed,   // bad target size or resampling failure
  AdapterFailed,  // inference backend failure (not loaded, shape mismatch, runtime)
  InvalidInput,   // stage received a payload it cannot consume
  InvalidConfig,
  StageFailed,    // a stage threw instead of returning an error
};

[[nodiscard]] constexpr std::string_view to_string(ClassifyError e) noexcept {
  switch (e) {
    case ClassifyError::None:
      return "none";
    case ClassifyError::DecodeFailed:
      return "decode failed";
    case ClassifyError::ResizeFailed:
      return "resize failed";
    case ClassifyError::AdapterFailed:
      return "inference adapter failed";
    case ClassifyError::InvalidInput:
      return "invalid input";
    case ClassifyError::InvalidConfig:
      return "invalid config";
    case ClassifyError::StageFailed:
      return "stage failed";
  }
  return "unknown";
}

}  // namespace sevclass::core
