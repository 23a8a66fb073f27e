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

#include "pipeline/stream_filter.h"

namespace fpga_image_processor {
namespace pipeline {

OutputSample PassthroughDelay::Step(const RasterSample& input) {
  // The output port reads the last register before this tick overwrites it.
  const PipelineRecord<Sample> last = stages_[kPipelineLatency - 1];
  for (int i = kPipelineLatency - 1; i > 0; --i) {
    stages_[i] = stages_[i - 1];
  }
  stages_[0].payload = input.sample;
  stages_[0].valid = input.valid;
  stages_[0].position = {input.column, input.row};
  return {last.payload, last.valid, last.position.column, last.position.row};
}

void PassthroughDelay::Reset() {
  for (auto& stage : stages_) {
    stage = PipelineRecord<Sample>();
  }
}

}  // namespace pipeline
}  // namespace fpga_image_processor
