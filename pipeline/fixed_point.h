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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_FIXED_POINT_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_FIXED_POINT_H_

#include <stdint.h>

#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Number of fractional bits in the Q8.8 format.
constexpr int kFractionalBits = 8;

// Q8.8 coefficient storage.
using Coefficient = int16_t;

// A sample promoted to Q8.8. 255 << 8 does not fit a signed 16-bit word, so
// promoted samples are carried sign-extended in 32 bits.
using PromotedSample = int32_t;

// Exact product of a promoted sample and a coefficient; |65280 * 32768| still
// fits 32 bits.
using Product = int32_t;

// Reduction-tree partial sums.
using Accumulator = int64_t;

inline PromotedSample PromoteToQ8_8(Sample sample) {
  return static_cast<PromotedSample>(sample) << kFractionalBits;
}

inline Product MultiplyExact(PromotedSample value, Coefficient coefficient) {
  return value * static_cast<Product>(coefficient);
}

// Sign-extending right shift that truncates toward negative infinity. Right
// shift of a negative value is implementation-defined before C++20, so the
// negative branch is written out.
inline Accumulator ArithmeticShiftRight(Accumulator value, int shift) {
  if (value >= 0) {
    return value >> shift;
  }
  return -((-value - 1) >> shift) - 1;
}

// Clamps a normalized result into the Sample range.
inline Sample Saturate(Accumulator value) {
  if (value < 0) return 0;
  if (value > 255) return 255;
  return static_cast<Sample>(value & 0xff);
}

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_FIXED_POINT_H_
