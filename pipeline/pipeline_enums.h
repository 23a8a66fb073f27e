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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_PIPELINE_ENUMS_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_PIPELINE_ENUMS_H_

#include <array>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/string_view.h"

namespace fpga_image_processor::pipeline {

// Preset coefficient tables.
enum class KernelType {
  kIdentity,
  kSobelX,
  kSobelY,
  kGaussian,
};

inline bool AbslParseFlag(absl::string_view text, KernelType* out,
                          std::string* error) {
  if (absl::EqualsIgnoreCase(text, "identity")) {
    *out = KernelType::kIdentity;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "sobel_x")) {
    *out = KernelType::kSobelX;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "sobel_y")) {
    *out = KernelType::kSobelY;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "gaussian")) {
    *out = KernelType::kGaussian;
    return true;
  }
  *error = "Unrecognized kernel.";
  return false;
}
inline std::string AbslUnparseFlag(KernelType in) {
  switch (in) {
    case KernelType::kIdentity:
      return "identity";
    case KernelType::kSobelX:
      return "sobel_x";
    case KernelType::kSobelY:
      return "sobel_y";
    case KernelType::kGaussian:
      return "gaussian";
  }
  return "unknown";
}

// Display modes. Every mode has its own pipeline instance and they all run in
// parallel; the multiplexer forwards one of them.
enum class Mode {
  kPassthrough,
  kIdentity,
  kSobelX,
  kSobelY,
  kEdge,
  kBlur,
};

constexpr std::array<Mode, 6> kAllModes = {
    Mode::kPassthrough, Mode::kIdentity, Mode::kSobelX,
    Mode::kSobelY,      Mode::kEdge,     Mode::kBlur,
};

inline bool AbslParseFlag(absl::string_view text, Mode* out,
                          std::string* error) {
  if (absl::EqualsIgnoreCase(text, "passthrough")) {
    *out = Mode::kPassthrough;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "identity")) {
    *out = Mode::kIdentity;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "sobel_x")) {
    *out = Mode::kSobelX;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "sobel_y")) {
    *out = Mode::kSobelY;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "edge")) {
    *out = Mode::kEdge;
    return true;
  }
  if (absl::EqualsIgnoreCase(text, "blur")) {
    *out = Mode::kBlur;
    return true;
  }
  *error = "Unrecognized mode.";
  return false;
}
inline std::string AbslUnparseFlag(Mode in) {
  switch (in) {
    case Mode::kPassthrough:
      return "passthrough";
    case Mode::kIdentity:
      return "identity";
    case Mode::kSobelX:
      return "sobel_x";
    case Mode::kSobelY:
      return "sobel_y";
    case Mode::kEdge:
      return "edge";
    case Mode::kBlur:
      return "blur";
  }
  return "unknown";
}

}  // namespace fpga_image_processor::pipeline

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_PIPELINE_ENUMS_H_
