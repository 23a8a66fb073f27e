// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "pipeline/convolution_pipeline.h"

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "pipeline/frame.h"
#include "pipeline/kernel_bank.h"
#include "pipeline/test_util.h"
#include "pipeline/types.h"
#include "xls/common/status/matchers.h"

namespace fpga_image_processor {
namespace pipeline {
namespace {

using ::xls::status_testing::StatusIs;

constexpr KernelType kAllKernels[] = {KernelType::kIdentity,
                                      KernelType::kSobelX, KernelType::kSobelY,
                                      KernelType::kGaussian};

std::vector<OutputSample> RunFrame(ConvolutionPipeline* pipeline,
                                   const Frame& frame) {
  return test_util::RunStream(pipeline, test_util::FrameTicks(frame));
}

TEST(ConvolutionPipelineTest, CreateRejectsMalformedConfiguration) {
  Kernel kernel = GetKernel(KernelType::kGaussian);
  kernel.norm_shift = 40;
  EXPECT_THAT(ConvolutionPipeline::Create(kernel, 8),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ConvolutionPipeline::Create(KernelType::kIdentity, 0),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ConvolutionPipelineTest, KernelIsFixedAtConstruction) {
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                              KernelType::kSobelY, 16));
  EXPECT_EQ(pipeline->kernel(), GetKernel(KernelType::kSobelY));
  EXPECT_EQ(pipeline->width(), 16);
  EXPECT_EQ(pipeline->latency(), 7);
}

// 8x3 ramp 0..23 through Identity: only columns 2..7 of row 2 come out valid,
// each exactly seven ticks after its input, carrying the window center.
// The window trails the raster position, so the value is the sample at
// (column - 1, row - 1) of the tag (9..14) rather than the input itself.
TEST(ConvolutionPipelineTest, IdentityRampScenario) {
  const Frame frame = test_util::RampFrame({8, 3});
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                              KernelType::kIdentity, 8));
  std::vector<OutputSample> out = RunFrame(pipeline.get(), frame);
  ASSERT_EQ(out.size(), 24 + kPipelineLatency);

  for (int tick = 0; tick < kPipelineLatency; ++tick) {
    EXPECT_FALSE(out[tick].valid) << "fill tick " << tick;
  }
  std::vector<Sample> valid_samples;
  for (int input = 0; input < 24; ++input) {
    const OutputSample& o = out[input + kPipelineLatency];
    EXPECT_EQ(o.column, input % 8);
    EXPECT_EQ(o.row, input / 8);
    EXPECT_EQ(o.valid, input >= 18) << "input " << input;
    if (o.valid) valid_samples.push_back(o.sample);
  }
  EXPECT_THAT(valid_samples, ::testing::ElementsAre(9, 10, 11, 12, 13, 14));
}

TEST(ConvolutionPipelineTest, IdentityPassesWindowCenterThrough) {
  const Frame frame = test_util::RandomFrame({11, 9}, 1234);
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                              KernelType::kIdentity, 11));
  int valid = 0;
  for (const OutputSample& o : RunFrame(pipeline.get(), frame)) {
    if (!o.valid) continue;
    ++valid;
    EXPECT_EQ(o.sample, frame.at(o.column - 1, o.row - 1))
        << "(" << o.column << ", " << o.row << ")";
  }
  EXPECT_EQ(valid, 9 * 7);
}

// Uniform 5x5 field of 128 through Gaussian.
TEST(ConvolutionPipelineTest, GaussianUniformScenario) {
  const Frame frame = MakeFrame({5, 5}, 128);
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                              KernelType::kGaussian, 5));
  int valid = 0;
  for (const OutputSample& o : RunFrame(pipeline.get(), frame)) {
    if (!o.valid) continue;
    ++valid;
    EXPECT_EQ(o.sample, 128);
  }
  EXPECT_EQ(valid, 9);
}

TEST(ConvolutionPipelineTest, GaussianPreservesAnyUniformField) {
  for (int level : {0, 1, 77, 200, 254, 255}) {
    const Frame frame = MakeFrame({9, 6}, static_cast<Sample>(level));
    XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                                KernelType::kGaussian, 9));
    for (const OutputSample& o : RunFrame(pipeline.get(), frame)) {
      if (o.valid) EXPECT_EQ(o.sample, level);
    }
  }
}

TEST(ConvolutionPipelineTest, BoundarySuppressionForEveryKernel) {
  const FrameGeometry geometry{6, 5};
  const Frame frame = test_util::RandomFrame(geometry, 5);
  for (KernelType type : kAllKernels) {
    XLS_ASSERT_OK_AND_ASSIGN(auto pipeline,
                             ConvolutionPipeline::Create(type, 6));
    std::vector<OutputSample> out = RunFrame(pipeline.get(), frame);
    for (int tick = 0; tick < out.size(); ++tick) {
      if (tick < kPipelineLatency) {
        EXPECT_FALSE(out[tick].valid);
        continue;
      }
      const int input = tick - kPipelineLatency;
      const int column = input % geometry.width;
      const int row = input / geometry.width;
      EXPECT_EQ(out[tick].valid, row >= 2 && column >= 2)
          << AbslUnparseFlag(type) << " input " << input;
    }
  }
}

TEST(ConvolutionPipelineTest, LatencyDoesNotDependOnKernel) {
  const Frame frame = test_util::RandomFrame({10, 4}, 77);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  for (KernelType type : kAllKernels) {
    XLS_ASSERT_OK_AND_ASSIGN(auto pipeline,
                             ConvolutionPipeline::Create(type, 10));
    for (int tick = 0; tick < ticks.size(); ++tick) {
      OutputSample o = pipeline->Step(ticks[tick]);
      if (tick < kPipelineLatency) continue;
      const RasterSample& source = ticks[tick - kPipelineLatency];
      EXPECT_EQ(o.column, source.column);
      EXPECT_EQ(o.row, source.row);
    }
  }
}

TEST(ConvolutionPipelineTest, NegativeResultSaturatesToZero) {
  Coefficients negative = {{{-1, -1, -1}, {-1, -1, -1}, {-1, -1, -1}}};
  XLS_ASSERT_OK_AND_ASSIGN(Kernel kernel, MakeKernel(negative, 8));
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(kernel, 4));
  int valid = 0;
  for (const OutputSample& o :
       RunFrame(pipeline.get(), MakeFrame({4, 4}, 10))) {
    if (!o.valid) continue;
    ++valid;
    EXPECT_EQ(o.sample, 0);
  }
  EXPECT_EQ(valid, 4);
}

TEST(ConvolutionPipelineTest, OverflowSaturatesTo255) {
  Coefficients doubled = {{{0, 0, 0}, {0, 2, 0}, {0, 0, 0}}};
  XLS_ASSERT_OK_AND_ASSIGN(Kernel kernel, MakeKernel(doubled, 8));
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(kernel, 4));
  Frame frame = MakeFrame({4, 4}, 100);
  frame.pixels[1 * 4 + 1] = 200;  // center of the window completed at (2, 2)
  std::vector<OutputSample> out = RunFrame(pipeline.get(), frame);

  const OutputSample& first = out[2 * 4 + 2 + kPipelineLatency];
  ASSERT_TRUE(first.valid);
  EXPECT_EQ(first.sample, 255);
  const OutputSample& second = out[2 * 4 + 3 + kPipelineLatency];
  ASSERT_TRUE(second.valid);
  EXPECT_EQ(second.sample, 200);
}

TEST(ConvolutionPipelineTest, NormalizationTruncatesFraction) {
  // 3 * 256 >> 9 is 1.5 in real terms; the fraction is discarded.
  Coefficients center = {{{0, 0, 0}, {0, 1, 0}, {0, 0, 0}}};
  XLS_ASSERT_OK_AND_ASSIGN(Kernel kernel, MakeKernel(center, 9));
  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(kernel, 3));
  for (const OutputSample& o : RunFrame(pipeline.get(), MakeFrame({3, 3}, 3))) {
    if (o.valid) EXPECT_EQ(o.sample, 1);
  }
}

TEST(ConvolutionPipelineTest, ReplayIsBitExact) {
  const Frame frame = test_util::RandomFrame({13, 7}, 2024);
  XLS_ASSERT_OK_AND_ASSIGN(auto first, ConvolutionPipeline::Create(
                                           KernelType::kSobelX, 13));
  XLS_ASSERT_OK_AND_ASSIGN(auto second, ConvolutionPipeline::Create(
                                            KernelType::kSobelX, 13));
  EXPECT_EQ(RunFrame(first.get(), frame), RunFrame(second.get(), frame));
}

TEST(ConvolutionPipelineTest, ResetDiscardsInFlightState) {
  const Frame noise = test_util::RandomFrame({8, 5}, 1);
  const Frame frame = test_util::RandomFrame({8, 5}, 2);
  XLS_ASSERT_OK_AND_ASSIGN(auto used, ConvolutionPipeline::Create(
                                          KernelType::kGaussian, 8));
  XLS_ASSERT_OK_AND_ASSIGN(auto fresh, ConvolutionPipeline::Create(
                                           KernelType::kGaussian, 8));

  // Stop mid-frame so that every stage holds a valid partial result.
  std::vector<RasterSample> noise_ticks = test_util::FrameTicks(noise);
  for (int tick = 0; tick < 30; ++tick) {
    used->Step(noise_ticks[tick]);
  }
  used->Reset();

  EXPECT_EQ(RunFrame(used.get(), frame), RunFrame(fresh.get(), frame));
}

TEST(ConvolutionPipelineTest, InvalidInputYieldsInvalidOutputLatencyLater) {
  const Frame frame = test_util::RandomFrame({6, 6}, 8);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  const int dropped = 4 * 6 + 3;
  ticks[dropped].valid = false;

  XLS_ASSERT_OK_AND_ASSIGN(auto pipeline, ConvolutionPipeline::Create(
                                              KernelType::kIdentity, 6));
  std::vector<OutputSample> out = test_util::RunStream(pipeline.get(), ticks);
  EXPECT_FALSE(out[dropped + kPipelineLatency].valid);
  EXPECT_EQ(out[dropped + kPipelineLatency].column, 3);
  EXPECT_EQ(out[dropped + kPipelineLatency].row, 4);
  EXPECT_TRUE(out[dropped + kPipelineLatency - 1].valid);
}

TEST(ConvolutionPipelineDeathTest, ConstructorFailsFastOnBadShift) {
  Kernel kernel = GetKernel(KernelType::kIdentity);
  kernel.norm_shift = -3;
  EXPECT_DEATH(ConvolutionPipeline(kernel, 4), "Normalization shift");
}

}  // namespace
}  // namespace pipeline
}  // namespace fpga_image_processor
