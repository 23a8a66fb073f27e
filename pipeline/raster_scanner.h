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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_RASTER_SCANNER_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_RASTER_SCANNER_H_

#include <stdint.h>

#include <vector>

#include "absl/status/statusor.h"
#include "pipeline/frame.h"
#include "pipeline/stream_filter.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Generates the position-tagged tick stream for a frame: every sample in
// raster order with a frame-global row counter, followed by `drain_ticks`
// invalid ticks that flush whatever is still in flight.
class RasterScanner {
 public:
  explicit RasterScanner(const FrameGeometry& geometry,
                         int drain_ticks = kPipelineLatency)
      : geometry_(geometry), drain_ticks_(drain_ticks) {}

  int64_t tick_count() const { return geometry_.pixel_count() + drain_ticks_; }

  // Returns tick number `tick` of `frame`; ticks past the last sample are
  // invalid and tagged just beyond the frame.
  RasterSample TickAt(const Frame& frame, int64_t tick) const;

  std::vector<RasterSample> Scan(const Frame& frame) const;

  const FrameGeometry& geometry() const { return geometry_; }

 private:
  FrameGeometry geometry_;
  int drain_ticks_;
};

// Resets `filter`, streams `frame` through it and stores each valid output at
// the position named by its tag. Positions with no valid output keep
// `invalid_fill`.
absl::StatusOr<FilteredFrame> ProcessFrame(StreamFilter* filter,
                                           const Frame& frame,
                                           Sample invalid_fill = 0);

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_RASTER_SCANNER_H_
