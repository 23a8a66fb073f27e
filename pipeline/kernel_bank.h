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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_KERNEL_BANK_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_KERNEL_BANK_H_

#include <array>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "pipeline/fixed_point.h"
#include "pipeline/pipeline_enums.h"

namespace fpga_image_processor {
namespace pipeline {

// Largest normalization shift a kernel may request.
constexpr int kMaxNormShift = 31;

using Coefficients = std::array<std::array<Coefficient, 3>, 3>;

// A 3x3 kernel. Coefficients are integer weights applied to Q8.8-promoted
// samples; `norm_shift` undoes both the 8-bit promotion and the weights' own
// scale (e.g. the Gaussian weights sum to 16, so its shift is 8 + 4).
struct Kernel {
  Coefficients coefficients = {};
  int norm_shift = kFractionalBits;
};

bool operator==(const Kernel& a, const Kernel& b);

// Returns the immutable preset for `type`.
const Kernel& GetKernel(KernelType type);

// Returns an error if `kernel` cannot be run by a ConvolutionPipeline.
absl::Status ValidateKernel(const Kernel& kernel);

// Builds a custom kernel, rejecting an out-of-range shift.
absl::StatusOr<Kernel> MakeKernel(const Coefficients& coefficients,
                                  int norm_shift);

// Human-readable rendering, one row per line.
std::string KernelToString(const Kernel& kernel);

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_KERNEL_BANK_H_
