#include <sevclass/core/classification.hpp>

namespace sevclass::core {

LabelSet default_labels() {
  return {"minor", "moderate", "severe"};
}

std::string to_display_string(const ClassificationResult& r) {
  if (const auto* p = std::get_if<Prediction>(&r)) {
    return p->label;
  }
  return "Invalid prediction (NaN)";
}

}  // namespace sevclass::core
