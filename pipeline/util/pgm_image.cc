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

#include "pipeline/util/pgm_image.h"

#include <stddef.h>

#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "xls/common/file/filesystem.h"
#include "xls/common/status/status_macros.h"

namespace fpga_image_processor {

namespace {

using pipeline::Frame;
using pipeline::FrameGeometry;
using pipeline::Sample;

// Walks the whitespace-separated header fields, skipping '#' comments.
class PgmReader {
 public:
  explicit PgmReader(absl::string_view contents) : contents_(contents) {}

  absl::StatusOr<absl::string_view> NextToken() {
    SkipSeparators();
    size_t start = pos_;
    while (pos_ < contents_.size() && !absl::ascii_isspace(contents_[pos_]) &&
           contents_[pos_] != '#') {
      ++pos_;
    }
    if (start == pos_) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unexpected end of PGM data at offset ", pos_));
    }
    return contents_.substr(start, pos_ - start);
  }

  absl::StatusOr<int> NextInt(absl::string_view field) {
    XLS_ASSIGN_OR_RETURN(absl::string_view token, NextToken());
    int value;
    if (!absl::SimpleAtoi(token, &value) || value < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Bad PGM ", field, ": \"", token, "\""));
    }
    return value;
  }

  // The binary raster starts after exactly one whitespace byte.
  absl::StatusOr<absl::string_view> RasterBytes(int64_t count) {
    if (pos_ >= contents_.size() || !absl::ascii_isspace(contents_[pos_])) {
      return absl::InvalidArgumentError("Missing separator before raster");
    }
    ++pos_;
    if (contents_.size() - pos_ < static_cast<size_t>(count)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("PGM raster truncated: %d of %d bytes",
                          contents_.size() - pos_, count));
    }
    return contents_.substr(pos_, count);
  }

 private:
  void SkipSeparators() {
    while (pos_ < contents_.size()) {
      if (absl::ascii_isspace(contents_[pos_])) {
        ++pos_;
      } else if (contents_[pos_] == '#') {
        while (pos_ < contents_.size() && contents_[pos_] != '\n') ++pos_;
      } else {
        break;
      }
    }
  }

  absl::string_view contents_;
  size_t pos_ = 0;
};

}  // namespace

absl::StatusOr<Frame> ParsePgm(absl::string_view contents) {
  PgmReader reader(contents);
  XLS_ASSIGN_OR_RETURN(absl::string_view magic, reader.NextToken());
  const bool binary = magic == "P5";
  if (!binary && magic != "P2") {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a graymap; magic is \"", magic, "\""));
  }

  FrameGeometry geometry;
  XLS_ASSIGN_OR_RETURN(geometry.width, reader.NextInt("width"));
  XLS_ASSIGN_OR_RETURN(geometry.height, reader.NextInt("height"));
  XLS_ASSIGN_OR_RETURN(int maxval, reader.NextInt("maxval"));
  XLS_RETURN_IF_ERROR(pipeline::ValidateGeometry(geometry));
  if (maxval < 1 || maxval > 255) {
    return absl::InvalidArgumentError(
        absl::StrCat("Only 8-bit graymaps are supported; maxval is ", maxval));
  }
  // Every sample takes at least one byte in either encoding.
  if (geometry.pixel_count() > static_cast<int64_t>(contents.size())) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%dx%d graymap cannot fit in %d bytes", geometry.width,
        geometry.height, contents.size()));
  }

  Frame frame = pipeline::MakeFrame(geometry);
  if (binary) {
    XLS_ASSIGN_OR_RETURN(absl::string_view raster,
                         reader.RasterBytes(geometry.pixel_count()));
    for (size_t i = 0; i < raster.size(); ++i) {
      frame.pixels[i] = static_cast<Sample>(raster[i]);
    }
  } else {
    for (Sample& pixel : frame.pixels) {
      XLS_ASSIGN_OR_RETURN(int value, reader.NextInt("sample"));
      if (value > maxval) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Sample %d exceeds maxval %d", value, maxval));
      }
      pixel = static_cast<Sample>(value);
    }
  }
  return frame;
}

std::string SerializePgm(const Frame& frame) {
  std::string out = absl::StrFormat("P5\n%d %d\n255\n", frame.geometry.width,
                                    frame.geometry.height);
  out.append(frame.pixels.begin(), frame.pixels.end());
  return out;
}

absl::StatusOr<Frame> ReadPgmFile(const std::filesystem::path& path) {
  XLS_ASSIGN_OR_RETURN(std::string contents, xls::GetFileContents(path));
  return ParsePgm(contents);
}

absl::Status WritePgmFile(const std::filesystem::path& path,
                          const Frame& frame) {
  XLS_RETURN_IF_ERROR(pipeline::ValidateFrame(frame));
  return xls::SetFileContents(path, SerializePgm(frame));
}

}  // namespace fpga_image_processor
