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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_TYPES_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_TYPES_H_

#include <stdint.h>

#include <array>

namespace fpga_image_processor {
namespace pipeline {

// Single-channel 8-bit intensity.
using Sample = uint8_t;

// Number of ticks between accepting a sample and emitting its result, counted
// from the raw sample: window, promote, multiply, two reduction levels, final
// sum, normalize and saturate.
constexpr int kPipelineLatency = 7;

// Raster-scan position. `row` is frame-global and never resets mid-frame.
struct PixelPosition {
  int32_t column = 0;
  int32_t row = 0;
};

// One input element per tick.
struct RasterSample {
  Sample sample = 0;
  bool valid = false;
  int32_t column = 0;
  int32_t row = 0;
};

// One output element per tick. The position tag is the tag of the input
// accepted `kPipelineLatency` ticks earlier.
struct OutputSample {
  Sample sample = 0;
  bool valid = false;
  int32_t column = 0;
  int32_t row = 0;
};

// A 3x3 neighborhood. cells[0] is the oldest row (global row - 2) and
// cells[r][0] the oldest column (column - 2); cells[2][2] is the sample that
// completed the window.
struct Window {
  std::array<std::array<Sample, 3>, 3> cells = {};
  bool valid = false;
};

inline bool operator==(const OutputSample& a, const OutputSample& b) {
  return a.sample == b.sample && a.valid == b.valid && a.column == b.column &&
         a.row == b.row;
}

inline bool operator!=(const OutputSample& a, const OutputSample& b) {
  return !(a == b);
}

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_TYPES_H_
