#include <sevclass/vision/classifier.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace sevclass::vision {

bool contains_nan(std::span<const float> scores) noexcept {
  return std::any_of(scores.begin(), scores.end(),
                     [](float v) { return std::isnan(v); });
}

std::vector<float> softmax(std::span<const float> scores) {
  std::vector<float> out(scores.size(), 0.f);
  if (scores.empty()) {
    return out;
  }

  const float max = *std::max_element(scores.begin(), scores.end());
  if (std::isinf(max)) {
    // +inf: mass goes to the +inf entries. -inf everywhere: no preference.
    const float target = max;
    const auto hits = static_cast<float>(std::count(scores.begin(), scores.end(), target));
    for (std::size_t i = 0; i < scores.size(); ++i) {
      out[i] = scores[i] == target ? 1.f / hits : 0.f;
    }
    return out;
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    const double e = std::exp(static_cast<double>(scores[i]) - max);
    out[i] = static_cast<float>(e);
    sum += e;
  }
  for (auto& v : out) {
    v = static_cast<float>(v / sum);
  }
  return out;
}

std::optional<std::size_t> argmax_first(std::span<const float> values) noexcept {
  if (values.empty()) {
    return std::nullopt;
  }
  // max_element returns the first of equal maxima.
  return static_cast<std::size_t>(
      std::distance(values.begin(), std::max_element(values.begin(), values.end())));
}

Classifier::Classifier(core::LabelSet labels) : labels_(std::move(labels)) {
  if (labels_.empty()) {
    throw std::invalid_argument("Classifier: label set must not be empty");
  }
}

core::ClassificationResult Classifier::classify(std::span<const float> scores) const {
  if (scores.empty() || scores.size() != labels_.size() || contains_nan(scores)) {
    return core::InvalidPrediction{std::vector<float>(scores.begin(), scores.end())};
  }

  std::vector<float> probabilities = softmax(scores);
  const auto best = argmax_first(probabilities);
  if (!best) {
    return core::InvalidPrediction{std::vector<float>(scores.begin(), scores.end())};
  }

  core::Prediction p;
  p.index = *best;
  p.label = labels_[*best];
  p.confidence = probabilities[*best];
  p.probabilities = std::move(probabilities);
  return p;
}

}  // namespace sevclass::vision
