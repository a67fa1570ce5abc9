#include <sevclass/app/config.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace sevclass::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

constexpr std::uint64_t kMaxDimension = static_cast<std::uint64_t>(std::numeric_limits<int>::max());

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw std::invalid_argument("config: bad value for " + key + ": '" + value + "'");
}

/// Pixel dimension in [0, INT_MAX]; OpenCV sizes are int.
std::uint32_t parse_dimension(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] < '0' || value[0] > '9') bad_value(key, value);
  std::size_t used = 0;
  unsigned long long n = 0;
  try {
    n = std::stoull(value, &used);
  } catch (const std::out_of_range&) {
    bad_value(key, value);
  }
  if (used != value.size() || n > kMaxDimension) bad_value(key, value);
  return static_cast<std::uint32_t>(n);
}

float parse_float(const std::string& key, const std::string& value) {
  std::size_t used = 0;
  float f = 0.f;
  try {
    f = std::stof(value, &used);
  } catch (const std::out_of_range&) {
    bad_value(key, value);
  }
  if (used != value.size()) bad_value(key, value);
  return f;
}

InferenceBackendType parse_backend(const std::string& value) {
  if (value == "onnx") return InferenceBackendType::Onnx;
  if (value == "mock") return InferenceBackendType::Mock;
  bad_value("backend_type", value);
}

core::LabelSet parse_labels(const std::string& value) {
  core::LabelSet labels;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (!item.empty()) labels.push_back(item);
  }
  return labels;
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.model_path = "";
  c.backend_type = InferenceBackendType::Mock;
  c.resize_width = 256;
  c.resize_height = 256;
  c.crop_size = 224;
  c.normalize_mean = 0.f;
  c.normalize_scale = 1.f / 255.f;
  c.labels = core::default_labels();
  return c;
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "model_path") c.model_path = value;
    else if (key == "backend_type") c.backend_type = parse_backend(value);
    else if (key == "input_name") c.input_name = value;
    else if (key == "output_name") c.output_name = value;
    else if (key == "resize_width") c.resize_width = parse_dimension(key, value);
    else if (key == "resize_height") c.resize_height = parse_dimension(key, value);
    else if (key == "crop_size") c.crop_size = parse_dimension(key, value);
    else if (key == "normalize_mean") c.normalize_mean = parse_float(key, value);
    else if (key == "normalize_scale") c.normalize_scale = parse_float(key, value);
    else if (key == "labels") c.labels = parse_labels(value);
  }
  return c;
}

std::expected<void, core::ClassifyError> validate_config(const PipelineConfig& config) {
  if (config.resize_width == 0 || config.resize_height == 0 || config.crop_size == 0) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  if (config.resize_width > kMaxDimension || config.resize_height > kMaxDimension ||
      config.crop_size > kMaxDimension) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  if (config.crop_size > config.resize_width || config.crop_size > config.resize_height) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  if (!std::isfinite(config.normalize_mean) || !std::isfinite(config.normalize_scale)) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  if (config.labels.empty()) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  if (config.backend_type == InferenceBackendType::Onnx && config.model_path.empty()) {
    return std::unexpected(core::ClassifyError::InvalidConfig);
  }
  return {};
}

}  // namespace sevclass::app
