#include <sevclass/core/pixel_buffer.hpp>
#include <sevclass/core/tensor.hpp>
#include <sevclass/vision/center_crop_normalize_stage.hpp>
#include "test_images.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sv = sevclass::vision;
namespace sc = sevclass::core;
namespace st = sevclass::test;

namespace {

/// Pixel values encode their own coordinates, so every tensor element can be traced back.
st::Rgba coord_pixel(std::uint32_t x, std::uint32_t y) {
  return {static_cast<std::uint8_t>(x), static_cast<std::uint8_t>(y),
          static_cast<std::uint8_t>((x + y) % 256), 17};
}

}  // namespace

TEST(CenterCropOffset, HalfOfDifferenceFloored) {
  EXPECT_EQ(sv::center_crop_offset(256, 224), 16);
  EXPECT_EQ(sv::center_crop_offset(224, 224), 0);
  EXPECT_EQ(sv::center_crop_offset(225, 224), 0);
  EXPECT_EQ(sv::center_crop_offset(227, 224), 1);
  EXPECT_EQ(sv::center_crop_offset(223, 224), -1);
  EXPECT_EQ(sv::center_crop_offset(220, 224), -2);
  EXPECT_EQ(sv::center_crop_offset(221, 224), -2);
}

TEST(CropNormalize, ShapeAndRange) {
  const auto img = st::make_pattern(256, 256, coord_pixel);
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  EXPECT_EQ(t.size(), 3u * 224 * 224);
  EXPECT_EQ(t.shape(), (sc::TensorShape{1, 3, 224, 224}));
  EXPECT_EQ(t.layout(), sc::TensorLayout::ChannelPlanar);
  for (float v : t.data()) {
    ASSERT_GE(v, 0.f);
    ASSERT_LE(v, 1.f);
  }
}

TEST(CropNormalize, UniformGrayGivesHalf) {
  const auto img = st::make_uniform(256, 256, {128, 128, 128, 255});
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  for (float v : t.data()) {
    ASSERT_NEAR(v, 128.f / 255.f, 1e-6f);
  }
}

TEST(CropNormalize, OriginMapsToSixteenSixteen) {
  const auto img = st::make_pattern(256, 256, coord_pixel);
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  EXPECT_FLOAT_EQ(t.at(0, 0, 0), 16.f / 255.f);
  EXPECT_FLOAT_EQ(t.at(1, 0, 0), 16.f / 255.f);
  EXPECT_FLOAT_EQ(t.at(2, 0, 0), 32.f / 255.f);
  // Last destination pixel is source (239, 239).
  EXPECT_FLOAT_EQ(t.at(0, 223, 223), 239.f / 255.f);
  EXPECT_FLOAT_EQ(t.at(1, 223, 223), 239.f / 255.f);
  // Row-major within a plane: x varies fastest.
  EXPECT_FLOAT_EQ(t.data()[1], 17.f / 255.f);
  EXPECT_FLOAT_EQ(t.data()[224], 16.f / 255.f);
}

TEST(CropNormalize, PlanesAreRedGreenBlueInOrder) {
  const auto img = st::make_uniform(256, 256, {10, 20, 30, 99});
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  const std::size_t plane = 224u * 224u;
  const auto d = t.data();
  EXPECT_FLOAT_EQ(d[0], 10.f / 255.f);
  EXPECT_FLOAT_EQ(d[plane - 1], 10.f / 255.f);
  EXPECT_FLOAT_EQ(d[plane], 20.f / 255.f);
  EXPECT_FLOAT_EQ(d[2 * plane - 1], 20.f / 255.f);
  EXPECT_FLOAT_EQ(d[2 * plane], 30.f / 255.f);
  EXPECT_FLOAT_EQ(d[3 * plane - 1], 30.f / 255.f);
}

TEST(CropNormalize, AlphaIsIgnored) {
  const auto opaque = st::make_uniform(230, 230, {40, 50, 60, 255});
  const auto clear = st::make_uniform(230, 230, {40, 50, 60, 0});
  const sc::Tensor a = sv::crop_normalize(opaque, sv::CropNormalizeConfig{});
  const sc::Tensor b = sv::crop_normalize(clear, sv::CropNormalizeConfig{});
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    ASSERT_EQ(a.data()[i], b.data()[i]);
  }
}

TEST(CropNormalize, OddDifferenceUsesFloor) {
  // 225 - 224 = 1: offset 0, so destination (0,0) reads source (0,0).
  const auto img = st::make_pattern(225, 225, coord_pixel);
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  EXPECT_FLOAT_EQ(t.at(0, 0, 0), 0.f);
  EXPECT_FLOAT_EQ(t.at(0, 0, 5), 5.f / 255.f);
  EXPECT_FLOAT_EQ(t.at(1, 7, 0), 7.f / 255.f);
}

TEST(CropNormalize, OutOfBoundsSourceIsZero) {
  // Source smaller than the crop: offset -2 on both axes, border stays 0.
  const auto img = st::make_uniform(220, 220, {255, 255, 255, 255});
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  EXPECT_EQ(t.size(), 3u * 224 * 224);
  for (std::uint32_t c = 0; c < 3; ++c) {
    EXPECT_FLOAT_EQ(t.at(c, 0, 0), 0.f);
    EXPECT_FLOAT_EQ(t.at(c, 1, 100), 0.f);
    EXPECT_FLOAT_EQ(t.at(c, 100, 223), 0.f);
    EXPECT_FLOAT_EQ(t.at(c, 2, 2), 1.f);
    EXPECT_FLOAT_EQ(t.at(c, 221, 221), 1.f);
    EXPECT_FLOAT_EQ(t.at(c, 222, 221), 0.f);
  }
}

TEST(CropNormalize, NonSquareSourceCentersEachAxis) {
  const auto img = st::make_pattern(240, 230, coord_pixel);
  const sc::Tensor t = sv::crop_normalize(img, sv::CropNormalizeConfig{});
  EXPECT_FLOAT_EQ(t.at(0, 0, 0), 8.f / 255.f);  // x offset (240-224)/2
  EXPECT_FLOAT_EQ(t.at(1, 0, 0), 3.f / 255.f);  // y offset (230-224)/2
}

TEST(CropNormalize, NanIsReplacedByZero) {
  sv::CropNormalizeConfig cfg;
  cfg.scale = std::numeric_limits<float>::quiet_NaN();
  const auto img = st::make_uniform(256, 256, {1, 2, 3});
  const sc::Tensor t = sv::crop_normalize(img, cfg);
  for (float v : t.data()) {
    ASSERT_FALSE(std::isnan(v));
    ASSERT_EQ(v, 0.f);
  }
}

TEST(CropNormalize, MeanAndScaleApplied) {
  sv::CropNormalizeConfig cfg;
  cfg.mean = 100.f;
  cfg.scale = 0.5f;
  const auto img = st::make_uniform(256, 256, {120, 100, 80});
  const sc::Tensor t = sv::crop_normalize(img, cfg);
  EXPECT_FLOAT_EQ(t.at(0, 10, 10), 10.f);
  EXPECT_FLOAT_EQ(t.at(1, 10, 10), 0.f);
  EXPECT_FLOAT_EQ(t.at(2, 10, 10), -10.f);
}

TEST(CropNormalize, InterleavedLayout) {
  sv::CropNormalizeConfig cfg;
  cfg.layout = sc::TensorLayout::Interleaved;
  const auto img = st::make_uniform(256, 256, {10, 20, 30});
  const sc::Tensor t = sv::crop_normalize(img, cfg);
  EXPECT_FLOAT_EQ(t.data()[0], 10.f / 255.f);
  EXPECT_FLOAT_EQ(t.data()[1], 20.f / 255.f);
  EXPECT_FLOAT_EQ(t.data()[2], 30.f / 255.f);
  EXPECT_FLOAT_EQ(t.data()[3], 10.f / 255.f);
}

TEST(CenterCropNormalizeStage, RejectsZeroCrop) {
  sv::CropNormalizeConfig cfg;
  cfg.crop_size = 0;
  EXPECT_THROW({ sv::CenterCropNormalizeStage stage(cfg); }, std::invalid_argument);
}

TEST(CenterCropNormalizeStage, ProducesTensor) {
  sv::CenterCropNormalizeStage stage(sv::CropNormalizeConfig{});
  auto out = stage.process(sc::StagePayload{st::make_uniform(256, 256, {})});
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(std::get<sc::Tensor>(*out).size(), 3u * 224 * 224);
}

TEST(CenterCropNormalizeStage, RejectsEmptyBuffer) {
  sv::CenterCropNormalizeStage stage(sv::CropNormalizeConfig{});
  auto out = stage.process(sc::StagePayload{sc::PixelBuffer{}});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::ClassifyError::InvalidInput);
}
