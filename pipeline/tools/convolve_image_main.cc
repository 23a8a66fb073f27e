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

// Streams a grayscale PGM image through the fixed-point convolution pipeline
// of one display mode and writes the filtered frame.
#include <stdint.h>

#include <filesystem>
#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "pipeline/frame.h"
#include "pipeline/mode_multiplexer.h"
#include "pipeline/pipeline_enums.h"
#include "pipeline/raster_scanner.h"
#include "pipeline/stream_filter.h"
#include "pipeline/util/pgm_image.h"
#include "xls/common/logging/logging.h"
#include "xls/common/status/status_macros.h"

namespace {

using fpga_image_processor::pipeline::Mode;

}  // namespace

ABSL_FLAG(std::string, input, "", "Path to the 8-bit PGM (P5 or P2) to read.");
ABSL_FLAG(std::string, output, "", "Path to write the filtered P5 image to.");
ABSL_FLAG(Mode, mode, Mode::kEdge,
          "Display mode. Choices are {passthrough, identity, sobel_x, "
          "sobel_y, edge, blur}. 'edge' sums the independently saturated "
          "Sobel-Gx and Sobel-Gy outputs; 'blur' is the 3x3 Gaussian.");
ABSL_FLAG(int32_t, invalid_fill, 0,
          "Sample value written where the pipeline produced no valid output "
          "(the first two rows and the first two columns of every row).");

namespace fpga_image_processor {
namespace pipeline {

absl::Status RealMain(const std::filesystem::path& input_path,
                      const std::filesystem::path& output_path, Mode mode,
                      int invalid_fill) {
  if (invalid_fill < 0 || invalid_fill > 255) {
    return absl::InvalidArgumentError(
        absl::StrFormat("--invalid_fill must be in [0, 255], got %d",
                        invalid_fill));
  }

  XLS_ASSIGN_OR_RETURN(Frame frame, ReadPgmFile(input_path));
  XLS_LOG(INFO) << absl::StreamFormat("Read %dx%d frame from %s",
                                      frame.geometry.width,
                                      frame.geometry.height,
                                      input_path.string());

  XLS_ASSIGN_OR_RETURN(std::unique_ptr<StreamFilter> filter,
                       CreateFilter(mode, frame.geometry.width));
  XLS_ASSIGN_OR_RETURN(
      FilteredFrame filtered,
      ProcessFrame(filter.get(), frame, static_cast<Sample>(invalid_fill)));
  XLS_LOG(INFO) << absl::StreamFormat(
      "Mode %s: %d of %d outputs valid", AbslUnparseFlag(mode),
      filtered.valid_count(), frame.geometry.pixel_count());

  XLS_RETURN_IF_ERROR(WritePgmFile(output_path, filtered.frame));
  XLS_LOG(INFO) << "Wrote " << output_path.string();
  return absl::OkStatus();
}

}  // namespace pipeline
}  // namespace fpga_image_processor

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(argv[0]);
  absl::ParseCommandLine(argc, argv);

  std::string input_path = absl::GetFlag(FLAGS_input);
  XLS_CHECK(!input_path.empty()) << "--input must be specified.";
  std::string output_path = absl::GetFlag(FLAGS_output);
  XLS_CHECK(!output_path.empty()) << "--output must be specified.";

  XLS_CHECK_OK(fpga_image_processor::pipeline::RealMain(
      input_path, output_path, absl::GetFlag(FLAGS_mode),
      absl::GetFlag(FLAGS_invalid_fill)));

  return 0;
}
