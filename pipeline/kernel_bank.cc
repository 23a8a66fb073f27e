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

#include "pipeline/kernel_bank.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "xls/common/logging/logging.h"

namespace fpga_image_processor {
namespace pipeline {

namespace {

const Kernel kIdentityKernel = {
    {{{0, 0, 0},  //
      {0, 1, 0},  //
      {0, 0, 0}}},
    8,
};

const Kernel kSobelXKernel = {
    {{{-1, 0, 1},  //
      {-2, 0, 2},  //
      {-1, 0, 1}}},
    8,
};

const Kernel kSobelYKernel = {
    {{{-1, -2, -1},  //
      {0, 0, 0},     //
      {1, 2, 1}}},
    8,
};

// Weights sum to 16: four extra bits of shift on top of the Q8.8 promotion.
const Kernel kGaussianKernel = {
    {{{1, 2, 1},  //
      {2, 4, 2},  //
      {1, 2, 1}}},
    12,
};

}  // namespace

bool operator==(const Kernel& a, const Kernel& b) {
  return a.coefficients == b.coefficients && a.norm_shift == b.norm_shift;
}

const Kernel& GetKernel(KernelType type) {
  switch (type) {
    case KernelType::kIdentity:
      return kIdentityKernel;
    case KernelType::kSobelX:
      return kSobelXKernel;
    case KernelType::kSobelY:
      return kSobelYKernel;
    case KernelType::kGaussian:
      return kGaussianKernel;
  }
  XLS_LOG(FATAL) << "Unknown kernel type " << static_cast<int>(type);
  return kIdentityKernel;
}

absl::Status ValidateKernel(const Kernel& kernel) {
  if (kernel.norm_shift < 0 || kernel.norm_shift > kMaxNormShift) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Normalization shift %d is outside [0, %d].",
                        kernel.norm_shift, kMaxNormShift));
  }
  return absl::OkStatus();
}

absl::StatusOr<Kernel> MakeKernel(const Coefficients& coefficients,
                                  int norm_shift) {
  Kernel kernel{coefficients, norm_shift};
  absl::Status status = ValidateKernel(kernel);
  if (!status.ok()) {
    return status;
  }
  return kernel;
}

std::string KernelToString(const Kernel& kernel) {
  std::vector<std::string> lines;
  for (const auto& row : kernel.coefficients) {
    lines.push_back(absl::StrCat("[", absl::StrJoin(row, ", "), "]"));
  }
  lines.push_back(absl::StrCat(">> ", kernel.norm_shift));
  return absl::StrJoin(lines, "\n");
}

}  // namespace pipeline
}  // namespace fpga_image_processor
