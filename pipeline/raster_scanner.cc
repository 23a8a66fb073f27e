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

#include "pipeline/raster_scanner.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "xls/common/logging/logging.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {
namespace pipeline {

RasterSample RasterScanner::TickAt(const Frame& frame, int64_t tick) const {
  RasterSample sample;
  if (tick < geometry_.pixel_count()) {
    sample.sample = frame.pixels[tick];
    sample.valid = true;
    sample.column = tick % geometry_.width;
    sample.row = tick / geometry_.width;
  } else {
    sample.column = 0;
    sample.row = geometry_.height;
  }
  return sample;
}

std::vector<RasterSample> RasterScanner::Scan(const Frame& frame) const {
  std::vector<RasterSample> ticks;
  ticks.reserve(tick_count());
  for (int64_t tick = 0; tick < tick_count(); ++tick) {
    ticks.push_back(TickAt(frame, tick));
  }
  return ticks;
}

absl::StatusOr<FilteredFrame> ProcessFrame(StreamFilter* filter,
                                           const Frame& frame,
                                           Sample invalid_fill) {
  XLS_RETURN_IF_ERROR(ValidateFrame(frame));
  const FrameGeometry& geometry = frame.geometry;
  if (geometry.width > filter->width()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%d-sample lines do not fit a filter of width %d", geometry.width,
        filter->width()));
  }

  filter->Reset();
  RasterScanner scanner(geometry, filter->latency());
  FilteredFrame result = MakeFilteredFrame(geometry, invalid_fill);

  for (int64_t tick = 0; tick < scanner.tick_count(); ++tick) {
    const OutputSample out = filter->Step(scanner.TickAt(frame, tick));
    if (!out.valid) {
      continue;
    }
    if (out.column < 0 || out.column >= geometry.width || out.row < 0 ||
        out.row >= geometry.height) {
      return absl::InternalError(absl::StrFormat(
          "Valid output tagged (%d, %d) outside the %dx%d frame", out.column,
          out.row, geometry.width, geometry.height));
    }
    const int64_t index =
        static_cast<int64_t>(out.row) * geometry.width + out.column;
    result.frame.pixels[index] = out.sample;
    result.valid[index] = true;
  }

  XLS_VLOG(1) << absl::StreamFormat("Processed %dx%d frame, %d valid outputs",
                                    geometry.width, geometry.height,
                                    result.valid_count());
  return result;
}

}  // namespace pipeline
}  // namespace fpga_image_processor
