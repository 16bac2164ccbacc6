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

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"

#include "surge/geometry/polygon.h"
#include "surge/geometry/position.h"
#include "surge/geometry/region.h"

namespace surge {

// A line dividing the plane into a western and an eastern half.
//
// A cut is either a straight meridian at a fixed longitude, or a composed line
// given by positions sorted by latitude.  A composed cut is a piecewise linear
// function lng = f(lat) and is extended with constant longitude beyond its
// first and last positions.
//
// Every cut gets a unique identity when created, copies share it.  Vertices a
// cut inserts into polygons are tagged with that identity so that a second
// split by the same cut sees them as exactly on the line.
class Cut {
 public:
  enum class Side { kWest, kEast, kOn };

  // A straight cut along a meridian.
  static Cut Straight(double lng);

  // A composed cut through the given positions, which are sorted by latitude
  // here.  When two positions share a latitude the later one wins.  There must
  // be at least one position.
  static Cut Composed(std::vector<Position> positions);

  uint64_t id() const { return id_; }

  bool IsStraight() const { return positions_.size() == 1; }

  // The positions defining the cut, sorted by latitude.
  absl::Span<const Position> positions() const { return positions_; }

  // Longitude of the cut at a given latitude.
  double LongitudeAt(double lat) const;

  // Classifies a position relative to the cut.  Positions within epsilon of
  // the cut longitude are on it.
  Side SideOf(const Position& p) const;

  // As above, but vertices tagged by this cut are always on it.
  Side SideOf(const Vertex& v) const;

  // Returns the cut's own vertices strictly between two latitudes, ordered
  // going from lat0 to lat1.  Straight cuts have none.
  std::vector<Position> BreakpointsBetween(double lat0, double lat1) const;

  // Range of longitudes covered by the cut.
  interval LongitudeRange() const;

  // Checks that a composed cut is a plausible wave front: the direction of the
  // line may only reverse a handful of times.
  absl::Status ValidateArc() const;

 private:
  Cut(uint64_t id, std::vector<Position> positions);

  static uint64_t NextId();

  uint64_t id_;
  std::vector<Position> positions_;
};

}  // namespace surge
