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


#include "pipeline/mode_multiplexer.h"

#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "pipeline/frame.h"
#include "pipeline/pipeline_enums.h"
#include "pipeline/test_util.h"
#include "pipeline/types.h"
#include "xls/common/status/matchers.h"

namespace fpga_image_processor {
namespace pipeline {
namespace {

using ::xls::status_testing::StatusIs;

TEST(CreateFilterTest, EveryModeIsLatencyAligned) {
  for (Mode mode : kAllModes) {
    XLS_ASSERT_OK_AND_ASSIGN(auto filter, CreateFilter(mode, 10));
    EXPECT_EQ(filter->latency(), kPipelineLatency) << AbslUnparseFlag(mode);
  }
}

TEST(CreateFilterTest, ReportsLineWidth) {
  for (Mode mode : kAllModes) {
    if (mode == Mode::kPassthrough) continue;
    XLS_ASSERT_OK_AND_ASSIGN(auto filter, CreateFilter(mode, 12));
    EXPECT_EQ(filter->width(), 12) << AbslUnparseFlag(mode);
  }
  PassthroughDelay delay;
  EXPECT_GE(delay.width(), 1 << 20);
  XLS_ASSERT_OK_AND_ASSIGN(auto mux, ModeMultiplexer::Create(12, Mode::kBlur));
  EXPECT_EQ(mux->width(), 12);
}

TEST(CreateFilterTest, RejectsEmptyLine) {
  EXPECT_THAT(CreateFilter(Mode::kBlur, 0),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ModeMultiplexer::Create(0, Mode::kEdge),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(PassthroughDelayTest, DelaysEveryTickBySevenCalls) {
  const Frame frame = test_util::RandomFrame({5, 3}, 21);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  PassthroughDelay delay;
  std::vector<OutputSample> out = test_util::RunStream(&delay, ticks);
  for (int tick = 0; tick < out.size(); ++tick) {
    if (tick < kPipelineLatency) {
      EXPECT_FALSE(out[tick].valid);
      continue;
    }
    const RasterSample& in = ticks[tick - kPipelineLatency];
    EXPECT_EQ(out[tick].valid, in.valid);
    EXPECT_EQ(out[tick].column, in.column);
    EXPECT_EQ(out[tick].row, in.row);
    if (in.valid) EXPECT_EQ(out[tick].sample, in.sample);
  }
}

TEST(ModeMultiplexerTest, SelectedModeMatchesStandaloneFilter) {
  const Frame frame = test_util::RandomFrame({9, 7}, 3);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  for (Mode mode : kAllModes) {
    XLS_ASSERT_OK_AND_ASSIGN(auto mux, ModeMultiplexer::Create(9, mode));
    XLS_ASSERT_OK_AND_ASSIGN(auto standalone, CreateFilter(mode, 9));
    EXPECT_EQ(mux->mode(), mode);
    EXPECT_EQ(test_util::RunStream(mux.get(), ticks),
              test_util::RunStream(standalone.get(), ticks))
        << AbslUnparseFlag(mode);
  }
}

// Every instance keeps running, so the newly selected mode is already warm.
TEST(ModeMultiplexerTest, SwitchTakesEffectOnNextStep) {
  const Frame frame = test_util::RandomFrame({8, 8}, 12);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  XLS_ASSERT_OK_AND_ASSIGN(auto mux, ModeMultiplexer::Create(8, Mode::kIdentity));
  XLS_ASSERT_OK_AND_ASSIGN(auto identity, CreateFilter(Mode::kIdentity, 8));
  XLS_ASSERT_OK_AND_ASSIGN(auto blur, CreateFilter(Mode::kBlur, 8));

  const int switch_tick = 40;
  for (int tick = 0; tick < ticks.size(); ++tick) {
    if (tick == switch_tick) {
      mux->SetMode(Mode::kBlur);
      EXPECT_EQ(mux->mode(), Mode::kBlur);
    }
    const OutputSample expected_identity = identity->Step(ticks[tick]);
    const OutputSample expected_blur = blur->Step(ticks[tick]);
    EXPECT_EQ(mux->Step(ticks[tick]),
              tick < switch_tick ? expected_identity : expected_blur)
        << "tick " << tick;
  }
}

TEST(ModeMultiplexerTest, ResetClearsEveryInstance) {
  const Frame frame = test_util::RandomFrame({6, 5}, 8);
  std::vector<RasterSample> ticks = test_util::FrameTicks(frame);
  XLS_ASSERT_OK_AND_ASSIGN(auto used, ModeMultiplexer::Create(6, Mode::kEdge));
  XLS_ASSERT_OK_AND_ASSIGN(auto fresh, ModeMultiplexer::Create(6, Mode::kSobelY));

  test_util::RunStream(used.get(), test_util::FrameTicks(
                                       test_util::RandomFrame({6, 5}, 9)));
  used->Reset();
  used->SetMode(Mode::kSobelY);
  EXPECT_EQ(test_util::RunStream(used.get(), ticks),
            test_util::RunStream(fresh.get(), ticks));
}

}  // namespace
}  // namespace pipeline
}  // namespace fpga_image_processor
