#pragma once

// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cmath>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"

namespace surge {

// Formats a number in engineering notation with an SI prefix, e.g. 12.5 km.
// Only the prefixes from milli to giga come up for distances on earth.
inline std::string engnot(double num, absl::string_view units = "",
  absl::string_view fmt = "%.1f") {

  // Discard the sign bit and find the scaling for the value.
  double val = std::abs(num);
  int    pow = 0;
  std::string prefix;
       if (val >= 1e+09) { prefix = "G"; pow = +9; }
  else if (val >= 1e+06) { prefix = "M"; pow = +6; }
  else if (val >= 1e+03) { prefix = "k"; pow = +3; }
  else if (val >= 1e+00 || val == 0) { pow = 0; }
  else                   { prefix = "m"; pow = -3; }

  // Scale value and restore sign bit.
  val *= std::pow(10, -pow);
  val = std::copysign(val, num);

  auto format = absl::ParsedFormat<'f'>::New(fmt);
  if (!format) {
    return "<badfmt>";
  }
  return absl::StrCat(absl::StrFormat(*format, val), " ", prefix, units);
}

// Formats a duration to whole seconds, e.g. "-1h2m3s".
inline std::string ShortDuration(absl::Duration d) {
  return absl::FormatDuration(absl::Trunc(d, absl::Seconds(1)));
}

}  // namespace surge
