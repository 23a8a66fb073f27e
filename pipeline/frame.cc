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

#include "pipeline/frame.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {
namespace pipeline {

int64_t FilteredFrame::valid_count() const {
  return std::count(valid.begin(), valid.end(), true);
}

Frame MakeFrame(const FrameGeometry& geometry, Sample fill) {
  Frame frame;
  frame.geometry = geometry;
  frame.pixels.assign(std::max<int64_t>(geometry.pixel_count(), 0), fill);
  return frame;
}

FilteredFrame MakeFilteredFrame(const FrameGeometry& geometry, Sample fill) {
  FilteredFrame filtered;
  filtered.frame = MakeFrame(geometry, fill);
  filtered.valid.assign(filtered.frame.pixels.size(), false);
  return filtered;
}

absl::Status ValidateGeometry(const FrameGeometry& geometry) {
  if (geometry.width < 1 || geometry.height < 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid frame geometry %dx%d", geometry.width,
                        geometry.height));
  }
  return absl::OkStatus();
}

absl::Status ValidateFrame(const Frame& frame) {
  XLS_RETURN_IF_ERROR(ValidateGeometry(frame.geometry));
  if (static_cast<int64_t>(frame.pixels.size()) !=
      frame.geometry.pixel_count()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Frame holds %d samples but its %dx%d geometry needs %d",
        frame.pixels.size(), frame.geometry.width, frame.geometry.height,
        frame.geometry.pixel_count()));
  }
  return absl::OkStatus();
}

}  // namespace pipeline
}  // namespace fpga_image_processor
