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

#include <stdint.h>

#include <memory>
#include <random>

#include "benchmark/benchmark.h"
#include "pipeline/frame.h"
#include "pipeline/mode_multiplexer.h"
#include "pipeline/pipeline_enums.h"
#include "pipeline/raster_scanner.h"
#include "pipeline/stream_filter.h"
#include "xls/common/logging/logging.h"

namespace fpga_image_processor {
namespace pipeline {
namespace {

Frame RandomFrame(const FrameGeometry& geometry) {
  std::mt19937 rng(555);
  std::uniform_int_distribution<int> dist(0, 255);
  Frame frame = MakeFrame(geometry);
  for (Sample& pixel : frame.pixels) {
    pixel = static_cast<Sample>(dist(rng));
  }
  return frame;
}

// One VGA frame per iteration through the filter of the given mode.
void BM_ProcessFrame(benchmark::State& state) {
  const Mode mode = static_cast<Mode>(state.range(0));
  const Frame frame = RandomFrame(FrameGeometry());
  auto filter = CreateFilter(mode, frame.geometry.width);
  XLS_CHECK_OK(filter.status());

  for (auto s : state) {
    auto result = ProcessFrame(filter->get(), frame);
    XLS_CHECK_OK(result.status());
    benchmark::DoNotOptimize(result);
  }
  state.SetLabel(AbslUnparseFlag(mode));
  state.SetItemsProcessed(state.iterations() * frame.geometry.pixel_count());
}
BENCHMARK(BM_ProcessFrame)->DenseRange(0, kAllModes.size() - 1);

// All six modes clocked together, as the multiplexer does in hardware.
void BM_MultiplexerStep(benchmark::State& state) {
  const FrameGeometry geometry;
  const Frame frame = RandomFrame(geometry);
  auto mux = ModeMultiplexer::Create(geometry.width, Mode::kEdge);
  XLS_CHECK_OK(mux.status());
  RasterScanner scanner(geometry);

  int64_t tick = 0;
  for (auto s : state) {
    benchmark::DoNotOptimize((*mux)->Step(scanner.TickAt(frame, tick)));
    tick = (tick + 1) % geometry.pixel_count();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MultiplexerStep);

}  // namespace
}  // namespace pipeline
}  // namespace fpga_image_processor

BENCHMARK_MAIN();
