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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_MODE_MULTIPLEXER_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_MODE_MULTIPLEXER_H_

#include <array>
#include <memory>
#include <utility>

#include "absl/status/statusor.h"
#include "pipeline/pipeline_enums.h"
#include "pipeline/stream_filter.h"
#include "pipeline/types.h"

namespace fpga_image_processor {
namespace pipeline {

// Builds the standalone filter for one display mode.
absl::StatusOr<std::unique_ptr<StreamFilter>> CreateFilter(Mode mode,
                                                           int width);

// Holds one filter per display mode and clocks all of them on every tick, the
// way parallel hardware instances share a clock; only the selected mode's
// output is forwarded. Since every instance has seen every tick, switching
// modes neither resets anything nor shifts the latency.
class ModeMultiplexer : public StreamFilter {
 public:
  static absl::StatusOr<std::unique_ptr<ModeMultiplexer>> Create(
      int width, Mode initial_mode);

  OutputSample Step(const RasterSample& input) override;
  void Reset() override;
  int latency() const override { return kPipelineLatency; }
  int width() const override { return width_; }

  // Takes effect on the next `Step`.
  void SetMode(Mode mode) { mode_ = mode; }
  Mode mode() const { return mode_; }

 private:
  using Filters = std::array<std::unique_ptr<StreamFilter>, kAllModes.size()>;

  ModeMultiplexer(Filters filters, int width, Mode initial_mode)
      : filters_(std::move(filters)), width_(width), mode_(initial_mode) {}

  Filters filters_;
  int width_;
  Mode mode_;
};

}  // namespace pipeline
}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_MODE_MULTIPLEXER_H_
