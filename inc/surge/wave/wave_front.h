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

#include <vector>

#include "absl/time/time.h"

#include "surge/geometry/bounding_box.h"
#include "surge/geometry/cut.h"
#include "surge/geometry/region.h"
#include "surge/wave/wave_definition.h"

namespace surge {

// The front of a wave within one slice of longitude.  Single front waves have
// one slice covering the whole area.
struct WaveFront {
  Cut cut;
  interval slice;
};

// Geometry of a wave definition laid over a bounding box.  Everything here is
// a pure function of the distance the wave has travelled since it started.
//
// Longitudes are unwrapped relative to the west edge of the box, so an area
// across the antimeridian sees longitudes beyond 180.
class WaveGeometry {
 public:
  // Latitude spacing of the bands approximating a curved front.
  static constexpr double kDefaultBandStep = 0.01;
  static constexpr int kDefaultMaxBands = 2000;

  WaveGeometry(const WaveDefinition& definition, const BoundingBox& bbox,
    double band_step = kDefaultBandStep, int max_bands = kDefaultMaxBands);

  const BoundingBox& bbox() const { return bbox_; }
  Direction direction() const { return direction_; }
  double speed() const { return speed_; }

  // Time for every front to cross its slice, measured at the widest latitude.
  absl::Duration TotalDuration() const { return total_duration_; }

  int slice_count() const { return static_cast<int>(slices_.size()); }
  const interval& Slice(int index) const { return slices_[index]; }

  // Index of the slice holding an (unwrapped) longitude, clamped to the
  // first and last slice.
  int SliceFor(double lng) const;

  // The slice a wave first shows up in: the westernmost for an eastward wave.
  int LeadingSlice() const;

  // Longitude of a slice's front at `lat` after travelling `distance` meters,
  // clamped to the slice.
  double FrontLongitude(int slice, double lat, double distance) const;

  // Distance, in meters along the direction of travel, from the start of a
  // slice's front to a position.  Negative before the start edge.
  double DistanceFromStart(int slice, const Position& p) const;

  // Fraction of its slice the front must cover to reach a position, in [0,1].
  double Fraction(int slice, const Position& p) const;

  // Builds the cut for every slice after travelling `distance` meters.
  std::vector<WaveFront> Fronts(double distance) const;

 private:
  // Latitude whose parallel defines the front at `lat`.  Deep waves measure
  // everything at the widest part of the box.
  double ReferenceLatitude(double lat) const;

  // Length of a slice along the parallel at `lat`, in meters.
  double SliceLength(double lat) const;

  bool curved_;
  Direction direction_;
  double speed_;
  BoundingBox bbox_;
  std::vector<interval> slices_;
  std::vector<double> band_lats_;
  std::vector<double> band_lengths_;
  absl::Duration total_duration_;
};

}  // namespace surge
