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

#include <ostream>

#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "surge/geometry/position.h"
#include "surge/geometry/region.h"

namespace surge {

class Polygon;

// A latitude/longitude box given by its south-west and north-east corners.
//
// South is never above north, but the longitudes aren't ordered: a box whose
// east edge is less than its west edge wraps across the antimeridian.  All of
// the planar queries below operate on the unwrapped longitude range
// [west, west+width], which may extend beyond 180.
class BoundingBox {
 public:
  BoundingBox() = default;

  BoundingBox(const Position& sw, const Position& ne);

  // Convenience constructor from edges.
  static BoundingBox FromEdges(double south, double west, double north, double east) {
    return BoundingBox(Position(south, west), Position(north, east));
  }

  // Builds a box from a planar region.  Longitudes beyond 180 are folded back
  // so that the resulting box wraps the antimeridian.
  static BoundingBox FromRegion(const region2& region);

  // Smallest non-wrapping box holding every position.  Returns an empty box
  // if there are no positions.
  static BoundingBox FromPositions(absl::Span<const Position> positions);

  // Smallest non-wrapping box holding every vertex of the polygons.
  static BoundingBox FromPolygons(absl::Span<const Polygon> polygons);

  const Position& sw() const { return sw_; }
  const Position& ne() const { return ne_; }

  double south() const { return sw_.lat; }
  double north() const { return ne_.lat; }
  double west()  const { return sw_.lng; }
  double east()  const { return ne_.lng; }

  // True if the box crosses the antimeridian.
  bool Wraps() const { return ne_.lng < sw_.lng; }

  // East edge expressed relative to the west edge so that it's never less.
  double UnwrappedEast() const { return west() + width(); }

  // Size of the box in degrees.
  double width() const;
  double height() const { return north() - south(); }

  Position center() const;

  // Latitude at which a line of constant latitude is longest inside the box:
  // zero when the box straddles the equator, otherwise the edge nearest it.
  double LatitudeOfWidestPart() const;

  // True if either dimension is zero, or the box is malformed.
  bool IsEmpty() const;

  // Returns true if the position is inside the box, boundary included.  The
  // longitude is compared modulo 360.
  bool Contains(const Position& p) const;

  // Returns a longitude shifted by a multiple of 360 so that it's as close as
  // possible to the unwrapped range of the box.
  double UnwrapLongitude(double lng) const;

  // Planar view of the box on unwrapped longitudes.
  region2 ToRegion() const;
  interval LongitudeInterval() const { return interval(west(), UnwrappedEast()); }
  interval LatitudeInterval() const { return interval(south(), north()); }

  bool operator==(const BoundingBox& b) const {
    return sw_ == b.sw_ && ne_ == b.ne_;
  }
  bool operator!=(const BoundingBox& b) const { return !(*this == b); }

  // Returns true if every edge is within `eps` degrees of the other box.
  bool ApproxEquals(const BoundingBox& b, double eps) const {
    return sw_.ApproxEquals(b.sw_, eps) && ne_.ApproxEquals(b.ne_, eps);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const BoundingBox& b) {
    absl::Format(&sink, "[%v - %v]", b.sw_, b.ne_);
  }

  friend std::ostream& operator<<(std::ostream& os, const BoundingBox& b) {
    return os << absl::StrFormat("%v", b);
  }

 private:
  Position sw_;
  Position ne_;
};

}  // namespace surge
