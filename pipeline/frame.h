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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_FRAME_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_FRAME_H_

#include <stdint.h>

#include <vector>

#include "absl/status/status.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Frame dimensions. The defaults match the 640x480 VGA frame store.
struct FrameGeometry {
  int width = 640;
  int height = 480;

  int64_t pixel_count() const { return static_cast<int64_t>(width) * height; }
};

// A row-major single-channel frame.
struct Frame {
  FrameGeometry geometry;
  std::vector<Sample> pixels;

  Sample at(int column, int row) const {
    return pixels[static_cast<int64_t>(row) * geometry.width + column];
  }
};

// A frame produced by a filter. Positions whose output was invalid hold the
// fill value and are flagged false in `valid`; they must be treated as
// absent.
struct FilteredFrame {
  Frame frame;
  std::vector<bool> valid;

  bool valid_at(int column, int row) const {
    return valid[static_cast<int64_t>(row) * frame.geometry.width + column];
  }
  int64_t valid_count() const;
};

// Returns a frame of the given geometry with every sample set to `fill`.
Frame MakeFrame(const FrameGeometry& geometry, Sample fill = 0);

// Returns an all-invalid filtered frame of the given geometry.
FilteredFrame MakeFilteredFrame(const FrameGeometry& geometry, Sample fill);

absl::Status ValidateGeometry(const FrameGeometry& geometry);

// Checks the geometry and that the pixel count matches it.
absl::Status ValidateFrame(const Frame& frame);

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_FRAME_H_
