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

#ifndef FPGA_IMAGE_PROCESSOR_PIPELINE_UTIL_PGM_IMAGE_H_
#define FPGA_IMAGE_PROCESSOR_PIPELINE_UTIL_PGM_IMAGE_H_

#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "pipeline/frame.h"

namespace fpga_image_processor {

// Parses a binary (P5) or ASCII (P2) portable graymap. Samples are kept as
// stored; a maxval above 255 is rejected.
absl::StatusOr<pipeline::Frame> ParsePgm(absl::string_view contents);

// Serializes `frame` as a binary (P5) graymap with maxval 255.
std::string SerializePgm(const pipeline::Frame& frame);

absl::StatusOr<pipeline::Frame> ReadPgmFile(const std::filesystem::path& path);

absl::Status WritePgmFile(const std::filesystem::path& path,
                          const pipeline::Frame& frame);

}  // namespace fpga_image_processor

#endif  // FPGA_IMAGE_PROCESSOR_PIPELINE_UTIL_PGM_IMAGE_H_
