#include <sevclass/core/error.hpp>
#include <sevclass/core/tensor.hpp>
#include <sevclass/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace sv = sevclass::vision;
namespace sc = sevclass::core;

namespace {

sc::Tensor model_input() {
  return sc::Tensor(sc::TensorShape{1, 3, 224, 224}, sc::TensorLayout::ChannelPlanar);
}

}  // namespace

TEST(MockInferenceBackend, ReturnsSetScores) {
  sv::MockInferenceBackend mock;
  mock.set_scores({2.f, 1.f, 0.1f});
  auto result = mock.infer(model_input());
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 3u);
  EXPECT_FLOAT_EQ((*result)[0], 2.f);
  EXPECT_FLOAT_EQ((*result)[2], 0.1f);
  EXPECT_EQ(mock.call_count(), 1u);
}

TEST(MockInferenceBackend, ConfiguredErrorIsReturned) {
  sv::MockInferenceBackend mock;
  mock.set_scores({1.f, 2.f, 3.f});
  mock.set_error(sc::ClassifyError::AdapterFailed);
  auto result = mock.infer(model_input());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::ClassifyError::AdapterFailed);

  mock.set_error(std::nullopt);
  EXPECT_TRUE(mock.infer(model_input()).has_value());
}

TEST(MockInferenceBackend, ValidateInputRejectsEmptyTensor) {
  sv::MockInferenceBackend mock;
  auto valid = mock.validate_input(sc::Tensor{});
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), sc::ClassifyError::AdapterFailed);
}

TEST(MockInferenceBackend, InferBatchReturnsOneResultPerTensor) {
  sv::MockInferenceBackend mock;
  mock.set_scores({0.f, 1.f, 0.f});
  std::vector<sc::Tensor> inputs;
  for (int i = 0; i < 3; ++i) inputs.push_back(model_input());
  auto results = mock.infer_batch(inputs);
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(results->size(), 3u);
  for (const auto& r : *results) {
    EXPECT_FLOAT_EQ(r[1], 1.f);
  }
}

TEST(MockInferenceBackend, InferBatchFailsOnEmptyTensor) {
  sv::MockInferenceBackend mock;
  std::vector<sc::Tensor> inputs;
  inputs.push_back(model_input());
  inputs.emplace_back();
  auto results = mock.infer_batch(inputs);
  ASSERT_FALSE(results.has_value());
  EXPECT_EQ(results.error(), sc::ClassifyError::AdapterFailed);
}
