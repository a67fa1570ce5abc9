#pragma once

#include <sevclass/core/classification.hpp>
#include <sevclass/core/tensor.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace sevclass::vision {

/// True if any score is NaN.
[[nodiscard]] bool contains_nan(std::span<const float> scores) noexcept;

/// exp(x_i) / sum_j exp(x_j), evaluated as exp(x_i - max) / sum_j exp(x_j - max).
/// Subtracting the maximum does not change the result, only avoids overflow.
/// +inf entries split the mass equally; an all -inf vector is uniform.
/// Input must not contain NaN.
[[nodiscard]] std::vector<float> softmax(std::span<const float> scores);

/// Index of the first maximum; nullopt for an empty span.
[[nodiscard]] std::optional<std::size_t> argmax_first(std::span<const float> values) noexcept;

/// Turns raw model scores into a label. Pure: no state between calls.
class Classifier {
 public:
  /// Throws std::invalid_argument for an empty label set.
  explicit Classifier(core::LabelSet labels = core::default_labels());

  /// NaN in scores, an empty vector, or a length different from the label set
  /// gives InvalidPrediction; softmax is not evaluated in that case.
  [[nodiscard]] core::ClassificationResult classify(std::span<const float> scores) const;

  [[nodiscard]] const core::LabelSet& labels() const noexcept { return labels_; }

 private:
  core::LabelSet labels_;
};

}  // namespace sevclass::vision
