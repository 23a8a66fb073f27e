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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_LINE_WINDOW_BUFFER_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_LINE_WINDOW_BUFFER_H_

#include "absl/container/fixed_array.h"
#include "absl/status/statusor.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Turns a raster-order sample stream into 3x3 windows while storing only two
// rows of history.
//
// The two row stores form a ring selected by the parity of the frame-global
// row counter: at row `r`, the store with parity `r & 1` still holds row
// `r - 2` and the other one holds row `r - 1`. Each accepted sample reads both
// stores at its column and then overwrites the older one, which rotates the
// ring at every row boundary without copying.
//
// Windows are not zero-padded. A window is valid only if the input tick was
// valid and both `row >= 2` and `column >= 2`; everything closer to the
// top-left corner is dropped.
class LineWindowBuffer {
 public:
  static absl::StatusOr<LineWindowBuffer> Create(int width);

  // Fatal if `width < 1`; prefer `Create` for unchecked input.
  explicit LineWindowBuffer(int width);

  // Moveable but not copyable.
  LineWindowBuffer(LineWindowBuffer&& other) = default;
  LineWindowBuffer(const LineWindowBuffer&) = delete;
  LineWindowBuffer& operator=(const LineWindowBuffer&) = delete;

  // Consumes one tick. An invalid tick leaves the row stores and window
  // registers untouched and returns an invalid window.
  Window Advance(const RasterSample& input);

  // Clears row stores and window registers.
  void Reset();

  int width() const { return width_; }

 private:
  Sample& Store(int parity, int column) {
    return rows_[parity * width_ + column];
  }

  int width_;
  absl::FixedArray<Sample> rows_;
  Window window_;
};

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_LINE_WINDOW_BUFFER_H_
