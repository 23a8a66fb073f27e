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

#include "pipeline/mode_multiplexer.h"

#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "pipeline/convolution_pipeline.h"
#include "pipeline/edge_magnitude_combiner.h"
#include "pipeline/kernel_bank.h"
#include "xls/common/logging/logging.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {
namespace pipeline {

absl::StatusOr<std::unique_ptr<StreamFilter>> CreateFilter(Mode mode,
                                                           int width) {
  switch (mode) {
    case Mode::kPassthrough:
      return std::make_unique<PassthroughDelay>();
    case Mode::kIdentity:
      return ConvolutionPipeline::Create(KernelType::kIdentity, width);
    case Mode::kSobelX:
      return ConvolutionPipeline::Create(KernelType::kSobelX, width);
    case Mode::kSobelY:
      return ConvolutionPipeline::Create(KernelType::kSobelY, width);
    case Mode::kEdge:
      return EdgeMagnitudeCombiner::Create(width);
    case Mode::kBlur:
      return ConvolutionPipeline::Create(KernelType::kGaussian, width);
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown mode ", static_cast<int>(mode)));
}

/*static*/ absl::StatusOr<std::unique_ptr<ModeMultiplexer>>
ModeMultiplexer::Create(int width, Mode initial_mode) {
  Filters filters;
  for (Mode mode : kAllModes) {
    XLS_ASSIGN_OR_RETURN(filters[static_cast<int>(mode)],
                         CreateFilter(mode, width));
    XLS_CHECK_EQ(filters[static_cast<int>(mode)]->latency(), kPipelineLatency)
        << "Mode " << AbslUnparseFlag(mode) << " is not latency-aligned";
  }
  XLS_VLOG(1) << "ModeMultiplexer: " << filters.size()
              << " instances, initial mode " << AbslUnparseFlag(initial_mode);
  return absl::WrapUnique(new ModeMultiplexer(std::move(filters), width, initial_mode));
}

OutputSample ModeMultiplexer::Step(const RasterSample& input) {
  OutputSample selected;
  for (Mode mode : kAllModes) {
    OutputSample out = filters_[static_cast<int>(mode)]->Step(input);
    if (mode == mode_) {
      selected = out;
    }
  }
  return selected;
}

void ModeMultiplexer::Reset() {
  for (auto& filter : filters_) {
    filter->Reset();
  }
}

}  // namespace pipeline
}  // namespace fpga_image_processor
