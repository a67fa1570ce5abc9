#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sevclass::core {

/// Ordered class labels; index i names model output i.
using LabelSet = std::vector<std::string>;

/// Labels the severity model was trained with. Do not reorder.
[[nodiscard]] LabelSet default_labels();

/// A usable prediction: arg-max label and the softmax distribution it came from.
struct Prediction {
  std::size_t index{0};
  std::string label;
  float confidence{0.f};
  std::vector<float> probabilities;
};

/// Model output could not be turned into a label (NaN scores, wrong length).
/// Kept distinct from every label so callers cannot mistake it for one.
struct InvalidPrediction {
  std::vector<float> raw_scores;
};

/// One-shot outcome for a single processed image.
using ClassificationResult = std::variant<Prediction, InvalidPrediction>;

[[nodiscard]] inline bool is_valid(const ClassificationResult& r) noexcept {
  return std::holds_alternative<Prediction>(r);
}

/// Text shown to the user: the label, or "Invalid prediction (NaN)".
[[nodiscard]] std::string to_display_string(const ClassificationResult& r);

}  // namespace sevclass::core
