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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_REFERENCE_MODEL_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_REFERENCE_MODEL_H_

#include "absl/status/statusor.h"
#include "pipeline/frame.h"
#include "pipeline/kernel_bank.h"
#include "pipeline/pipeline_enums.h"

// Whole-frame golden model of the streaming engine. It shares only the
// fixed-point helpers with the pipeline: windows are read straight out of the
// frame and the nine products are summed left to right.
//
// The output at (column, row) is valid iff row >= 2 and column >= 2, and is
// computed over rows row-2..row and columns column-2..column.

namespace fpga_image_processor {
namespace pipeline {

absl::StatusOr<FilteredFrame> ReferenceConvolve(const Kernel& kernel,
                                                const Frame& frame,
                                                Sample invalid_fill = 0);

absl::StatusOr<FilteredFrame> ReferenceEdgeMagnitude(const Frame& frame,
                                                     Sample invalid_fill = 0);

// Dispatches on the display mode. Passthrough copies every sample as valid.
absl::StatusOr<FilteredFrame> ReferenceProcess(Mode mode, const Frame& frame,
                                               Sample invalid_fill = 0);

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_REFERENCE_MODEL_H_
