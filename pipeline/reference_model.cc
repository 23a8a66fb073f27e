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

#include "pipeline/reference_model.h"

#include <stddef.h>
#include <stdint.h>

#include "absl/status/status.h"
#include "pipeline/edge_magnitude_combiner.h"
#include "pipeline/fixed_point.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {
namespace pipeline {

namespace {

Sample ConvolveAt(const Kernel& kernel, const Frame& frame, int column,
                  int row) {
  Accumulator sum = 0;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      sum += MultiplyExact(PromoteToQ8_8(frame.at(column - 2 + j, row - 2 + i)),
                           kernel.coefficients[i][j]);
    }
  }
  return Saturate(ArithmeticShiftRight(sum, kernel.norm_shift));
}

}  // namespace

absl::StatusOr<FilteredFrame> ReferenceConvolve(const Kernel& kernel,
                                                const Frame& frame,
                                                Sample invalid_fill) {
  XLS_RETURN_IF_ERROR(ValidateKernel(kernel));
  XLS_RETURN_IF_ERROR(ValidateFrame(frame));

  const FrameGeometry& geometry = frame.geometry;
  FilteredFrame result = MakeFilteredFrame(geometry, invalid_fill);
  for (int row = 2; row < geometry.height; ++row) {
    for (int column = 2; column < geometry.width; ++column) {
      const int64_t index = static_cast<int64_t>(row) * geometry.width + column;
      result.frame.pixels[index] = ConvolveAt(kernel, frame, column, row);
      result.valid[index] = true;
    }
  }
  return result;
}

absl::StatusOr<FilteredFrame> ReferenceEdgeMagnitude(const Frame& frame,
                                                     Sample invalid_fill) {
  XLS_ASSIGN_OR_RETURN(
      FilteredFrame gx,
      ReferenceConvolve(GetKernel(KernelType::kSobelX), frame, invalid_fill));
  XLS_ASSIGN_OR_RETURN(
      FilteredFrame gy,
      ReferenceConvolve(GetKernel(KernelType::kSobelY), frame, invalid_fill));

  FilteredFrame result = MakeFilteredFrame(frame.geometry, invalid_fill);
  for (size_t i = 0; i < result.valid.size(); ++i) {
    if (gx.valid[i] && gy.valid[i]) {
      result.frame.pixels[i] =
          CombineMagnitude(gx.frame.pixels[i], gy.frame.pixels[i]);
      result.valid[i] = true;
    }
  }
  return result;
}

absl::StatusOr<FilteredFrame> ReferenceProcess(Mode mode, const Frame& frame,
                                               Sample invalid_fill) {
  switch (mode) {
    case Mode::kPassthrough: {
      XLS_RETURN_IF_ERROR(ValidateFrame(frame));
      FilteredFrame result;
      result.frame = frame;
      result.valid.assign(frame.pixels.size(), true);
      return result;
    }
    case Mode::kIdentity:
      return ReferenceConvolve(GetKernel(KernelType::kIdentity), frame,
                               invalid_fill);
    case Mode::kSobelX:
      return ReferenceConvolve(GetKernel(KernelType::kSobelX), frame,
                               invalid_fill);
    case Mode::kSobelY:
      return ReferenceConvolve(GetKernel(KernelType::kSobelY), frame,
                               invalid_fill);
    case Mode::kEdge:
      return ReferenceEdgeMagnitude(frame, invalid_fill);
    case Mode::kBlur:
      return ReferenceConvolve(GetKernel(KernelType::kGaussian), frame,
                               invalid_fill);
  }
  return absl::InvalidArgumentError("Unknown mode");
}

}  // namespace pipeline
}  // namespace fpga_image_processor
