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

#include "pipeline/line_window_buffer.h"

#include <algorithm>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "xls/common/logging/logging.h"

namespace fpga_image_processor {
namespace pipeline {

/*static*/ absl::StatusOr<LineWindowBuffer> LineWindowBuffer::Create(
    int width) {
  if (width < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Line width must be positive, got ", width));
  }
  return LineWindowBuffer(width);
}

LineWindowBuffer::LineWindowBuffer(int width)
    : width_(width), rows_(2 * std::max(width, 1), 0) {
  XLS_CHECK_GE(width, 1);
  XLS_VLOG(1) << "LineWindowBuffer: two row stores of " << width
              << " samples";
}

Window LineWindowBuffer::Advance(const RasterSample& input) {
  if (!input.valid) {
    Window idle = window_;
    idle.valid = false;
    return idle;
  }
  XLS_CHECK(input.column >= 0 && input.column < width_)
      << "Column " << input.column << " outside line of width " << width_;
  XLS_CHECK_GE(input.row, 0);

  const int parity = input.row & 1;
  Sample& oldest = Store(parity, input.column);
  const Sample previous = Store(parity ^ 1, input.column);

  for (auto& row : window_.cells) {
    row[0] = row[1];
    row[1] = row[2];
  }
  window_.cells[0][2] = oldest;
  window_.cells[1][2] = previous;
  window_.cells[2][2] = input.sample;
  oldest = input.sample;

  window_.valid = input.row >= 2 && input.column >= 2;
  return window_;
}

void LineWindowBuffer::Reset() {
  std::fill(rows_.begin(), rows_.end(), 0);
  window_ = Window();
}

}  // namespace pipeline
}  // namespace fpga_image_processor
