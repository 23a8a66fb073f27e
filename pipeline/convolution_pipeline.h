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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_CONVOLUTION_PIPELINE_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_CONVOLUTION_PIPELINE_H_

#include <array>
#include <memory>

#include "absl/status/statusor.h"
#include "pipeline/fixed_point.h"
#include "pipeline/kernel_bank.h"
#include "pipeline/line_window_buffer.h"
#include "pipeline/stream_filter.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// A fixed-point 3x3 convolution over a raster stream, one result per tick.
//
// Register stages, each advanced once per `Step`:
//
//   window     3x3 samples from the owned LineWindowBuffer
//   promoted   nine Q8.8 cells
//   products   nine exact 32-bit coefficient products
//   level1     four pair sums; the ninth product rides along
//   level2     two sums of pairs; the ninth product rides along
//   sum        level2[0] + level2[1] + ninth product
//   normalized arithmetic right shift by the kernel's `norm_shift`
//   saturated  clamp to [0, 255]
//
// A sample accepted by `Step` call n is returned by call n + 7, whatever the
// kernel. Validity and the position tag travel with the payload unchanged.
class ConvolutionPipeline : public StreamFilter {
 public:
  static absl::StatusOr<std::unique_ptr<ConvolutionPipeline>> Create(
      const Kernel& kernel, int width);
  static absl::StatusOr<std::unique_ptr<ConvolutionPipeline>> Create(
      KernelType type, int width);

  // Fatal on a malformed kernel or width.
  ConvolutionPipeline(const Kernel& kernel, int width);

  OutputSample Step(const RasterSample& input) override;
  void Reset() override;
  int latency() const override { return kPipelineLatency; }

  const Kernel& kernel() const { return kernel_; }
  int width() const override { return line_buffer_.width(); }

 private:
  using Cells = std::array<PromotedSample, 9>;
  using Products = std::array<Product, 9>;
  // Partial sums plus the carried ninth product in the last slot.
  using Level1 = std::array<Accumulator, 5>;
  using Level2 = std::array<Accumulator, 3>;

  Products Multiply(const Cells& cells) const;

  const Kernel kernel_;
  LineWindowBuffer line_buffer_;

  PipelineRecord<Window> window_;
  PipelineRecord<Cells> promoted_;
  PipelineRecord<Products> products_;
  PipelineRecord<Level1> level1_;
  PipelineRecord<Level2> level2_;
  PipelineRecord<Accumulator> sum_;
  PipelineRecord<Accumulator> normalized_;
  PipelineRecord<Sample> saturated_;
};

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_CONVOLUTION_PIPELINE_H_
