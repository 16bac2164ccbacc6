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

#include "surge/geometry/bounding_box.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "surge/geometry/polygon.h"

namespace surge {

BoundingBox::BoundingBox(const Position& sw, const Position& ne)
  : sw_(std::min(sw.lat, ne.lat), sw.lng),
    ne_(std::max(sw.lat, ne.lat), ne.lng) {}

BoundingBox BoundingBox::FromRegion(const region2& region) {
  double west = region.xinterval().v0();
  double east = region.xinterval().v1();
  if (east > 180.0 || west < -180.0) {
    west = NormalizeLongitude(west);
    east = NormalizeLongitude(east);
  }
  return BoundingBox(
    Position(region.yinterval().v0(), west),
    Position(region.yinterval().v1(), east));
}

BoundingBox BoundingBox::FromPositions(absl::Span<const Position> positions) {
  if (positions.empty()) {
    return BoundingBox();
  }

  double south = positions[0].lat, north = positions[0].lat;
  double west  = positions[0].lng, east  = positions[0].lng;
  for (const Position& p : positions) {
    south = std::min(south, p.lat);
    north = std::max(north, p.lat);
    west  = std::min(west,  p.lng);
    east  = std::max(east,  p.lng);
  }
  return FromEdges(south, west, north, east);
}

BoundingBox BoundingBox::FromPolygons(absl::Span<const Polygon> polygons) {
  std::vector<Position> positions;
  for (const Polygon& polygon : polygons) {
    for (const Vertex& v : polygon.vertices()) {
      positions.push_back(v.pos);
    }
  }
  return FromPositions(positions);
}

double BoundingBox::width() const {
  double width = east() - west();
  if (width < 0) {
    width += 360.0;
  }
  return width;
}

Position BoundingBox::center() const {
  double lng = west() + width()/2;
  if (Wraps() && lng > 180.0) {
    lng -= 360.0;
  }
  return Position((south() + north())/2, lng);
}

double BoundingBox::LatitudeOfWidestPart() const {
  if (south() <= 0 && north() >= 0) {
    return 0;
  }
  return std::abs(south()) < std::abs(north()) ? south() : north();
}

bool BoundingBox::IsEmpty() const {
  const double w = width();
  const double h = height();
  return !(w > 0) || !(h > 0) || !std::isfinite(w) || !std::isfinite(h);
}

double BoundingBox::UnwrapLongitude(double lng) const {
  if (!std::isfinite(lng)) {
    return lng;
  }

  // Bring the longitude within 360 of the west edge, then pick whichever
  // representative lies in, or closest to, the range.
  const double lo = west();
  const double hi = UnwrappedEast();
  double shifted = lng - 360.0*std::floor((lng - lo)/360.0);
  if (shifted > hi) {
    const double below = shifted - 360.0;
    if (lo - below < shifted - hi) {
      shifted = below;
    }
  }
  return shifted;
}

bool BoundingBox::Contains(const Position& p) const {
  if (p.lat < south() || p.lat > north()) {
    return false;
  }
  return LongitudeInterval().contains(UnwrapLongitude(p.lng));
}

region2 BoundingBox::ToRegion() const {
  return region2(LongitudeInterval(), LatitudeInterval());
}

}  // namespace surge
