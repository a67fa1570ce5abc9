#include <sevclass/app/pipeline_builder.hpp>
#include <sevclass/vision/center_crop_normalize_stage.hpp>
#include <sevclass/vision/classification_stage.hpp>
#include <sevclass/vision/classifier.hpp>
#include <sevclass/vision/jpeg_decoder.hpp>
#include <sevclass/vision/mock_inference_backend.hpp>
#include <sevclass/vision/onnx_inference_backend.hpp>
#include <sevclass/vision/resize_stage.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace sevclass::app {

core::Pipeline build_pipeline(const PipelineConfig& config,
                              std::unique_ptr<vision::IInferenceBackend> backend) {
  using namespace sevclass::vision;

  auto valid = validate_config(config);
  if (!valid) {
    throw std::invalid_argument("build_pipeline: " + std::string(core::to_string(valid.error())));
  }

  CropNormalizeConfig crop;
  crop.crop_size = config.crop_size;
  crop.mean = config.normalize_mean;
  crop.scale = config.normalize_scale;
  crop.layout = core::TensorLayout::ChannelPlanar;
  if (const auto* onnx = dynamic_cast<const OnnxInferenceBackend*>(backend.get())) {
    crop.layout = onnx->input_layout();
  }

  core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<DecodeStage>());
  pipeline.add_stage(std::make_unique<ResizeStage>(config.resize_width, config.resize_height,
                                                   ResizeMode::Stretch));
  pipeline.add_stage(std::make_unique<CenterCropNormalizeStage>(crop));
  pipeline.add_stage(std::make_unique<ClassificationStage>(std::move(backend),
                                                           Classifier(config.labels)));
  return pipeline;
}

std::unique_ptr<vision::IInferenceBackend> make_backend(const PipelineConfig& config) {
  using namespace sevclass::vision;

  if (config.backend_type == InferenceBackendType::Onnx) {
    if (config.model_path.empty()) {
      throw std::runtime_error("backend_type=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_unique<OnnxInferenceBackend>(config.model_path, config.input_name,
                                                       config.output_name);
    const auto shape = onnx->input_shape();
    if (shape.height != config.crop_size || shape.width != config.crop_size) {
      throw std::runtime_error("model input is " + std::to_string(shape.width) + "x" +
                               std::to_string(shape.height) + " but crop_size is " +
                               std::to_string(config.crop_size));
    }
    if (onnx->num_classes() != 0 && onnx->num_classes() != config.labels.size()) {
      throw std::runtime_error("model has " + std::to_string(onnx->num_classes()) +
                               " outputs but " + std::to_string(config.labels.size()) +
                               " labels are configured");
    }
    onnx->warmup();
    return onnx;
  }

  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_scores(core::ScoreVector(config.labels.size(), 0.f));
  return mock;
}

}  // namespace sevclass::app
