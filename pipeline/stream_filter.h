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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_STREAM_FILTER_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_STREAM_FILTER_H_

#include <limits>

#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// A synchronous per-tick stage. Each call to `Step` is one tick: it consumes
// exactly one input element and produces exactly one (possibly invalid)
// output element, `latency()` ticks behind the input. Nothing blocks and
// nothing is dropped once accepted.
class StreamFilter {
 public:
  virtual ~StreamFilter() = default;

  virtual OutputSample Step(const RasterSample& input) = 0;

  // Returns every register to its freshly-constructed state. In-flight
  // results are discarded.
  virtual void Reset() = 0;

  virtual int latency() const = 0;

  // Widest line the filter accepts.
  virtual int width() const = 0;
};

// A register chain carrying a payload together with its validity and the
// position tag of the input it was derived from.
template <typename Payload>
struct PipelineRecord {
  Payload payload = {};
  bool valid = false;
  PixelPosition position;
};

// Moves `in` one stage forward, transforming its payload and carrying the
// validity and tag unchanged.
template <typename Out, typename In, typename Fn>
PipelineRecord<Out> Latch(const PipelineRecord<In>& in, Fn fn) {
  PipelineRecord<Out> out;
  out.payload = fn(in.payload);
  out.valid = in.valid;
  out.position = in.position;
  return out;
}

// A pure delay line of `kPipelineLatency` ticks; the "passthrough" display
// mode, aligned with the filtering modes.
class PassthroughDelay : public StreamFilter {
 public:
  OutputSample Step(const RasterSample& input) override;
  void Reset() override;
  int latency() const override { return kPipelineLatency; }
  int width() const override { return std::numeric_limits<int>::max(); }

 private:
  PipelineRecord<Sample> stages_[kPipelineLatency];
};

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_STREAM_FILTER_H_
