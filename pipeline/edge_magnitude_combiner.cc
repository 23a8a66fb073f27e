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

#include "pipeline/edge_magnitude_combiner.h"

#include <stdint.h>

#include <memory>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "pipeline/kernel_bank.h"
#include "xls/common/logging/logging.h"

namespace fpga_image_processor {
namespace pipeline {

Sample CombineMagnitude(Sample gx, Sample gy) {
  const uint16_t sum = static_cast<uint16_t>(gx) + gy;
  return sum > 255 ? 255 : static_cast<Sample>(sum);
}

/*static*/ absl::StatusOr<std::unique_ptr<EdgeMagnitudeCombiner>>
EdgeMagnitudeCombiner::Create(int width) {
  if (width < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Line width must be positive, got ", width));
  }
  return std::make_unique<EdgeMagnitudeCombiner>(width);
}

EdgeMagnitudeCombiner::EdgeMagnitudeCombiner(int width)
    : gx_(GetKernel(KernelType::kSobelX), width),
      gy_(GetKernel(KernelType::kSobelY), width) {
  XLS_CHECK_EQ(gx_.latency(), gy_.latency());
}

OutputSample EdgeMagnitudeCombiner::Step(const RasterSample& input) {
  const OutputSample gx = gx_.Step(input);
  const OutputSample gy = gy_.Step(input);

  OutputSample out;
  out.sample = CombineMagnitude(gx.sample, gy.sample);
  out.valid = gx.valid && gy.valid;
  out.column = gx.column;
  out.row = gx.row;
  return out;
}

void EdgeMagnitudeCombiner::Reset() {
  gx_.Reset();
  gy_.Reset();
}

}  // namespace pipeline
}  // namespace fpga_image_processor
