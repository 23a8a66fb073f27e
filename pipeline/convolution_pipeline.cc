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

#include "pipeline/convolution_pipeline.h"

#include <memory>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "xls/common/logging/logging.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {
namespace pipeline {

/*static*/ absl::StatusOr<std::unique_ptr<ConvolutionPipeline>>
ConvolutionPipeline::Create(const Kernel& kernel, int width) {
  XLS_RETURN_IF_ERROR(ValidateKernel(kernel));
  if (width < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Line width must be positive, got ", width));
  }
  return std::make_unique<ConvolutionPipeline>(kernel, width);
}

/*static*/ absl::StatusOr<std::unique_ptr<ConvolutionPipeline>>
ConvolutionPipeline::Create(KernelType type, int width) {
  return Create(GetKernel(type), width);
}

ConvolutionPipeline::ConvolutionPipeline(const Kernel& kernel, int width)
    : kernel_(kernel), line_buffer_(width) {
  XLS_CHECK_OK(ValidateKernel(kernel_));
  XLS_VLOG(1) << "ConvolutionPipeline: width " << width << ", kernel\n"
              << KernelToString(kernel_);
}

ConvolutionPipeline::Products ConvolutionPipeline::Multiply(
    const Cells& cells) const {
  Products products;
  for (int i = 0; i < 9; ++i) {
    products[i] = MultiplyExact(cells[i], kernel_.coefficients[i / 3][i % 3]);
  }
  return products;
}

OutputSample ConvolutionPipeline::Step(const RasterSample& input) {
  // Stages are latched back to front so that each one consumes what its
  // predecessor held at the end of the previous tick.
  saturated_ = Latch<Sample>(normalized_, &Saturate);

  const int shift = kernel_.norm_shift;
  normalized_ = Latch<Accumulator>(sum_, [shift](Accumulator sum) {
    return ArithmeticShiftRight(sum, shift);
  });

  sum_ = Latch<Accumulator>(level2_, [](const Level2& in) {
    return (in[0] + in[1]) + in[2];
  });

  level2_ = Latch<Level2>(level1_, [](const Level1& in) {
    return Level2{in[0] + in[1], in[2] + in[3], in[4]};
  });

  level1_ = Latch<Level1>(products_, [](const Products& in) {
    return Level1{static_cast<Accumulator>(in[0]) + in[1],
                  static_cast<Accumulator>(in[2]) + in[3],
                  static_cast<Accumulator>(in[4]) + in[5],
                  static_cast<Accumulator>(in[6]) + in[7], in[8]};
  });

  products_ = Latch<Products>(
      promoted_, [this](const Cells& in) { return Multiply(in); });

  promoted_ = Latch<Cells>(window_, [](const Window& in) {
    Cells cells;
    for (int i = 0; i < 9; ++i) {
      cells[i] = PromoteToQ8_8(in.cells[i / 3][i % 3]);
    }
    return cells;
  });

  window_.payload = line_buffer_.Advance(input);
  window_.valid = window_.payload.valid;
  window_.position = {input.column, input.row};

  return {saturated_.payload, saturated_.valid, saturated_.position.column,
          saturated_.position.row};
}

void ConvolutionPipeline::Reset() {
  line_buffer_.Reset();
  window_ = PipelineRecord<Window>();
  promoted_ = PipelineRecord<Cells>();
  products_ = PipelineRecord<Products>();
  level1_ = PipelineRecord<Level1>();
  level2_ = PipelineRecord<Level2>();
  sum_ = PipelineRecord<Accumulator>();
  normalized_ = PipelineRecord<Accumulator>();
  saturated_ = PipelineRecord<Sample>();
  XLS_VLOG(2) << "ConvolutionPipeline reset";
}

}  // namespace pipeline
}  // namespace fpga_image_processor
