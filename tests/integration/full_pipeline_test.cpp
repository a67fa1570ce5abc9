#include <sevclass/app/config.hpp>
#include <sevclass/app/pipeline_builder.hpp>
#include <sevclass/app/pipeline_runner.hpp>
#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline.hpp>
#include <sevclass/core/tensor.hpp>
#include <sevclass/vision/inference_backend.hpp>
#include <sevclass/vision/mock_inference_backend.hpp>
#include "test_images.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

using namespace sevclass::core;
using namespace sevclass::vision;
using namespace sevclass::app;
namespace st = sevclass::test;

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

/// Returns fixed scores and keeps a copy of the last tensor it was given.
class RecordingBackend : public IInferenceBackend {
 public:
  explicit RecordingBackend(ScoreVector scores) : scores_(std::move(scores)) {}

  std::expected<ScoreVector, ClassifyError> infer(const Tensor& input) override {
    std::lock_guard lock(mutex_);
    last_ = Tensor(input.shape(), input.layout(),
                   std::vector<float>(input.data().begin(), input.data().end()));
    return scores_;
  }

  Tensor last() const {
    std::lock_guard lock(mutex_);
    return last_;
  }

 private:
  ScoreVector scores_;
  mutable std::mutex mutex_;
  Tensor last_;
};

Pipeline build_mock_pipeline(ScoreVector scores) {
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_scores(std::move(scores));
  return build_pipeline(default_config(), std::move(mock));
}

}  // namespace

TEST(FullPipeline, GrayImageClassifiedAsMinor) {
  auto backend = std::make_unique<RecordingBackend>(ScoreVector{2.0f, 1.0f, 0.1f});
  auto* recorder = backend.get();
  const Pipeline pipeline = build_pipeline(default_config(), std::move(backend));
  ASSERT_EQ(pipeline.stage_count(), 4u);

  const auto jpeg = st::make_jpeg(256, 256, {128, 128, 128});
  auto result = run_pipeline(pipeline, jpeg);
  ASSERT_TRUE(result.has_value()) << "Pipeline run failed";
  const auto* pred = std::get_if<Prediction>(&*result);
  ASSERT_NE(pred, nullptr);
  EXPECT_EQ(pred->index, 0u);
  EXPECT_EQ(pred->label, "minor");

  const Tensor seen = recorder->last();
  EXPECT_EQ(seen.shape(), (TensorShape{1, 3, 224, 224}));
  EXPECT_EQ(seen.layout(), TensorLayout::ChannelPlanar);
  for (float v : seen.data()) {
    ASSERT_NEAR(v, 128.f / 255.f, 2.f / 255.f);
  }
}

TEST(FullPipeline, NanScoresGiveInvalidPrediction) {
  const Pipeline pipeline = build_mock_pipeline({kNaN, 0.5f, 0.3f});
  auto result = run_pipeline(pipeline, st::make_jpeg(256, 256, {10, 200, 30}));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(std::holds_alternative<InvalidPrediction>(*result));
  EXPECT_EQ(to_display_string(*result), "Invalid prediction (NaN)");
}

TEST(FullPipeline, TieResolvesToFirstLabel) {
  const Pipeline pipeline = build_mock_pipeline({1.0f, 1.0f, 1.0f});
  auto result = run_pipeline(pipeline, st::make_jpeg(120, 400, {0, 0, 0}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(to_display_string(*result), "minor");
}

TEST(FullPipeline, StretchedNonSquareImageReachesModelAt224) {
  auto backend = std::make_unique<RecordingBackend>(ScoreVector{0.f, 0.f, 1.f});
  auto* recorder = backend.get();
  const Pipeline pipeline = build_pipeline(default_config(), std::move(backend));
  auto result = run_pipeline(pipeline, st::make_jpeg(640, 120, {255, 0, 0}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(to_display_string(*result), "severe");
  const Tensor seen = recorder->last();
  EXPECT_EQ(seen.size(), 3u * 224 * 224);
  // Stretched, not letterboxed: no padding rows, every pixel is red.
  EXPECT_NEAR(seen.at(0, 0, 0), 1.f, 4.f / 255.f);
  EXPECT_NEAR(seen.at(0, 223, 223), 1.f, 4.f / 255.f);
  EXPECT_NEAR(seen.at(1, 0, 112), 0.f, 4.f / 255.f);
}

TEST(FullPipeline, CorruptBytesAreDecodeError) {
  const Pipeline pipeline = build_mock_pipeline({1.f, 0.f, 0.f});
  const std::vector<std::byte> junk(512, std::byte{0x5A});
  auto result = run_pipeline(pipeline, junk);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ClassifyError::DecodeFailed);
}

TEST(FullPipeline, AdapterFailureIsReported) {
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_error(ClassifyError::AdapterFailed);
  const Pipeline pipeline = build_pipeline(default_config(), std::move(mock));
  auto result = run_pipeline(pipeline, st::make_jpeg(64, 64, {1, 2, 3}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ClassifyError::AdapterFailed);
}

TEST(FullPipeline, DecodedBufferInput) {
  const Pipeline pipeline = build_mock_pipeline({0.f, 3.f, 0.f});
  auto result = pipeline.run(st::make_uniform(300, 300, {5, 5, 5}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(to_display_string(*result), "moderate");
}

TEST(FullPipeline, BuildRejectsInvalidConfig) {
  PipelineConfig cfg = default_config();
  cfg.crop_size = 512;
  EXPECT_THROW((void)build_pipeline(cfg, std::make_unique<MockInferenceBackend>()),
               std::invalid_argument);
}

TEST(FullPipeline, BatchParallelReportsEveryImage) {
  const Pipeline pipeline = build_mock_pipeline({0.1f, 0.2f, 0.9f});
  std::vector<std::vector<std::byte>> images;
  for (int i = 0; i < 8; ++i) {
    images.push_back(st::make_jpeg(64 + 8 * i, 64, {100, 100, 100}));
  }
  images[3] = std::vector<std::byte>{std::byte{0xFF}, std::byte{0xD8}};  // truncated

  std::vector<int> seen(images.size(), 0);
  std::vector<std::string> shown(images.size());
  std::mutex results_mutex;
  run_pipeline_batch_parallel(
      pipeline, images,
      [&](std::size_t idx, const ClassificationOutcome& outcome) {
        std::lock_guard lock(results_mutex);
        seen[idx]++;
        shown[idx] = outcome ? to_display_string(*outcome) : std::string(to_string(outcome.error()));
      },
      3);

  for (std::size_t i = 0; i < images.size(); ++i) {
    EXPECT_EQ(seen[i], 1) << "image " << i;
    EXPECT_EQ(shown[i], i == 3 ? "decode failed" : "severe") << "image " << i;
  }
}

TEST(FullPipeline, SequentialBatchKeepsOrder) {
  const Pipeline pipeline = build_mock_pipeline({0.9f, 0.2f, 0.1f});
  std::vector<std::vector<std::byte>> images = {st::make_jpeg(32, 32, {1, 1, 1}),
                                                st::make_jpeg(48, 32, {2, 2, 2})};
  std::vector<std::size_t> order;
  run_pipeline_batch(pipeline, images, [&](std::size_t idx, const ClassificationOutcome& outcome) {
    EXPECT_TRUE(outcome.has_value());
    order.push_back(idx);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1}));
}

TEST(FullPipeline, StageTimingCallbackInvoked) {
  const Pipeline pipeline = build_mock_pipeline({1.f, 2.f, 3.f});
  std::vector<std::pair<std::size_t, double>> timings;
  StageTimingCallback timing_cb = [&](std::size_t idx, double ms) {
    timings.emplace_back(idx, ms);
  };

  auto result = run_pipeline(pipeline, st::make_jpeg(64, 64, {9, 9, 9}), &timing_cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(timings.size(), 4u);  // decode, resize, crop+normalize, classify
  for (std::size_t i = 0; i < timings.size(); ++i) {
    EXPECT_EQ(timings[i].first, i);
    EXPECT_GE(timings[i].second, 0.0);
  }
}
