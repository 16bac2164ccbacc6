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
#include <ostream>
#include <string>

#include "absl/strings/str_format.h"
#include "s2/s2latlng.h"

#include "surge/geometry/region.h"

namespace surge {

// Mean equatorial radius used for every distance in the engine.
inline constexpr double kEarthRadiusMeters = 6378137.0;

// Tolerance when comparing coordinates, in degrees.
inline constexpr double kCoordinateEpsilon = 1e-9;

// A geographic position in degrees.
//
// Longitude is stored exactly as given.  Areas that span the antimeridian are
// expressed with longitudes beyond ±180 so that they stay contiguous, and it's
// up to whoever builds the position to decide whether to normalize.
struct Position {
  double lat = 0;
  double lng = 0;

  Position() = default;
  constexpr Position(double lat, double lng)
    : lat(lat), lng(lng) {}

  // Planar view of the position (x=lng, y=lat).
  pnt2 xy() const { return pnt2(lng, lat); }
  static Position FromXY(const pnt2& p) { return Position(p[1], p[0]); }

  S2LatLng ToLatLng() const { return S2LatLng::FromDegrees(lat, lng); }

  // Returns true if the latitude is in range and both values are finite.
  bool IsValid() const;

  // Lexicographic ordering by (lat, lng).
  bool operator<(const Position& b) const {
    return lat < b.lat || (lat == b.lat && lng < b.lng);
  }

  bool operator==(const Position& b) const {
    return lat == b.lat && lng == b.lng;
  }
  bool operator!=(const Position& b) const { return !(*this == b); }

  // Returns true if both coordinates are within epsilon of each other.
  bool ApproxEquals(const Position& b, double eps = kCoordinateEpsilon) const {
    return std::abs(lat - b.lat) <= eps && std::abs(lng - b.lng) <= eps;
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Position& p) {
    absl::Format(&sink, "(%.6f, %.6f)", p.lat, p.lng);
  }

  friend std::ostream& operator<<(std::ostream& os, const Position& p) {
    return os << absl::StrFormat("%v", p);
  }
};

// Wraps a longitude into [-180, 180).
double NormalizeLongitude(double lng);

// Great circle distance between two positions in meters.
double GeodesicDistance(const Position& a, const Position& b);

// Distance in meters when travelling along the parallel at `lat` from `lng0`
// to `lng1`.  The path is accumulated from geodesic steps of at most one degree
// so the result follows the parallel rather than cutting across it.  The sign
// follows the sign of lng1-lng0.
double ParallelDistance(double lng0, double lng1, double lat);

}  // namespace surge
