#include <sevclass/vision/onnx_inference_backend.hpp>
#include "ort_call.hpp"
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sevclass::vision {

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Position of name in the model's input or output list; throws if absent.
template <typename GetName>
std::size_t FindByName(std::size_t count, const std::string& name, GetName get_name) {
  for (std::size_t i = 0; i < count; ++i) {
    if (get_name(i) == name) return i;
  }
  throw std::runtime_error("OnnxInferenceBackend: model has no tensor named '" + name + "'");
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "sevclass"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  std::string input_name;
  std::string output_name;
  core::TensorShape input_shape{};
  core::TensorLayout input_layout{core::TensorLayout::ChannelPlanar};
  std::size_t num_classes{0};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::string input_name,
                                           std::string output_name)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);
  Ort::AllocatorWithDefaultOptions allocator;

  const std::size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  std::size_t input_index = 0;
  if (input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    input_index = FindByName(num_inputs, input_name, [&](std::size_t i) {
      return std::string(impl_->session.GetInputNameAllocated(i, allocator).get());
    });
    impl_->input_name = std::move(input_name);
  }

  const auto input_info = impl_->session.GetInputTypeInfo(input_index).GetTensorTypeAndShapeInfo();
  if (input_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    throw std::runtime_error("OnnxInferenceBackend: expected float32 input");
  }
  const std::vector<std::int64_t> dims = input_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]. A dynamic batch (-1) is run with 1.
  std::int64_t h = 0;
  std::int64_t w = 0;
  if (dims[1] == kNumChannels) {
    impl_->input_layout = core::TensorLayout::ChannelPlanar;
    h = dims[2];
    w = dims[3];
  } else if (dims[3] == kNumChannels) {
    impl_->input_layout = core::TensorLayout::Interleaved;
    h = dims[1];
    w = dims[2];
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (h <= 0 || w <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: input height/width must be fixed");
  }
  impl_->input_shape = core::TensorShape{1, static_cast<std::uint32_t>(kNumChannels),
                                         static_cast<std::uint32_t>(h),
                                         static_cast<std::uint32_t>(w)};

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  std::size_t output_index = 0;
  if (output_name.empty()) {
    impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();
  } else {
    output_index = FindByName(num_outputs, output_name, [&](std::size_t i) {
      return std::string(impl_->session.GetOutputNameAllocated(i, allocator).get());
    });
    impl_->output_name = std::move(output_name);
  }

  const auto output_info = impl_->session.GetOutputTypeInfo(output_index).GetTensorTypeAndShapeInfo();
  if (output_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    throw std::runtime_error("OnnxInferenceBackend: expected float32 output");
  }
  // Scores per image: product of the non-batch dimensions, if all are fixed.
  const std::vector<std::int64_t> out_dims = output_info.GetShape();
  std::size_t classes = out_dims.empty() ? 0 : 1;
  for (std::size_t i = out_dims.size() > 1 ? 1 : 0; i < out_dims.size(); ++i) {
    if (out_dims[i] <= 0) {
      classes = 0;
      break;
    }
    classes *= static_cast<std::size_t>(out_dims[i]);
  }
  impl_->num_classes = classes;
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

core::TensorShape OnnxInferenceBackend::input_shape() const noexcept {
  return impl_->input_shape;
}

core::TensorLayout OnnxInferenceBackend::input_layout() const noexcept {
  return impl_->input_layout;
}

std::size_t OnnxInferenceBackend::num_classes() const noexcept {
  return impl_->num_classes;
}

std::expected<void, core::ClassifyError>
OnnxInferenceBackend::validate_input(const core::Tensor& input) const {
  if (input.empty()) {
    return std::unexpected(core::ClassifyError::AdapterFailed);
  }
  if (input.layout() != impl_->input_layout || input.shape() != impl_->input_shape) {
    return std::unexpected(core::ClassifyError::AdapterFailed);
  }
  return {};
}

std::expected<core::ScoreVector, core::ClassifyError>
OnnxInferenceBackend::infer(const core::Tensor& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  return detail::guarded_ort_call([&]() -> std::expected<core::ScoreVector, core::ClassifyError> {
    const auto shape = input.shape().dims(input.layout());
    const auto data = input.data();
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    // ONNX Runtime only reads input buffers.
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(data.data()), data.size(),
        shape.data(), shape.size());

    const char* input_names_c[] = {impl_->input_name.c_str()};
    const char* output_names_c[] = {impl_->output_name.c_str()};
    Ort::RunOptions run_options;
    std::vector<Ort::Value> outputs = impl_->session.Run(run_options,
                                                         input_names_c, &input_tensor, 1,
                                                         output_names_c, 1);

    if (outputs.size() != 1u || !outputs[0].IsTensor()) {
      return std::unexpected(core::ClassifyError::AdapterFailed);
    }
    const auto out_info = outputs[0].GetTensorTypeAndShapeInfo();
    const std::size_t count = out_info.GetElementCount();
    if (count == 0 || (impl_->num_classes != 0 && count != impl_->num_classes)) {
      return std::unexpected(core::ClassifyError::AdapterFailed);
    }
    const float* scores = outputs[0].GetTensorData<float>();
    return core::ScoreVector(scores, scores + count);
  });
}

void OnnxInferenceBackend::warmup() {
  const core::Tensor zeros(impl_->input_shape, impl_->input_layout);
  (void)infer(zeros);
}

}  // namespace sevclass::vision
