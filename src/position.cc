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

#include "surge/geometry/position.h"

#include <algorithm>
#include <cmath>

#include "s2/s1angle.h"

namespace surge {

namespace {

// Longest single step when integrating distance along a parallel.
constexpr double kParallelStepDegrees = 1.0;

}  // namespace

bool Position::IsValid() const {
  return std::isfinite(lat) && std::isfinite(lng) && lat >= -90 && lat <= 90;
}

double NormalizeLongitude(double lng) {
  double wrapped = std::fmod(lng + 180.0, 360.0);
  if (wrapped < 0) {
    wrapped += 360.0;
  }
  return wrapped - 180.0;
}

double GeodesicDistance(const Position& a, const Position& b) {
  const S1Angle angle = a.ToLatLng().GetDistance(b.ToLatLng());
  return angle.radians()*kEarthRadiusMeters;
}

double ParallelDistance(double lng0, double lng1, double lat) {
  const double span = lng1 - lng0;
  if (span == 0 || !std::isfinite(span)) {
    return 0;
  }

  const double clat = std::clamp(lat, -90.0, 90.0);
  const int steps = std::max(1,
    static_cast<int>(std::ceil(std::abs(span)/kParallelStepDegrees)));
  const double step = span/steps;

  // Every step along a parallel has the same length, so measure one and scale.
  const double one = GeodesicDistance(
    Position(clat, lng0), Position(clat, lng0 + step));
  return std::copysign(one*steps, span);
}

}  // namespace surge
