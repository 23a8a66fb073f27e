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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_EDGE_MAGNITUDE_COMBINER_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_EDGE_MAGNITUDE_COMBINER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "pipeline/convolution_pipeline.h"
#include "pipeline/stream_filter.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Sums two already-saturated gradient samples into a 9-bit value and clamps
// it back to 8 bits. This approximates |Gx| + |Gy| only for non-negative
// gradients; negative ones were clipped to zero by their own pipelines.
Sample CombineMagnitude(Sample gx, Sample gy);

// Runs a Sobel-Gx and a Sobel-Gy pipeline side by side on the same raster
// stream and merges them into an edge-strength stream. The merge adds no
// register, so the latency is that of a single ConvolutionPipeline.
class EdgeMagnitudeCombiner : public StreamFilter {
 public:
  static absl::StatusOr<std::unique_ptr<EdgeMagnitudeCombiner>> Create(
      int width);

  explicit EdgeMagnitudeCombiner(int width);

  OutputSample Step(const RasterSample& input) override;
  void Reset() override;
  int latency() const override { return gx_.latency(); }
  int width() const override { return gx_.width(); }

 private:
  ConvolutionPipeline gx_;
  ConvolutionPipeline gy_;
};

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_EDGE_MAGNITUDE_COMBINER_H_
