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
#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

#include "surge/geometry/bounding_box.h"
#include "surge/geometry/position.h"

namespace surge {

// Identity of the cut that produced a vertex, along with the two positions it
// was interpolated between.  A later split by the same cut recognizes the
// vertex as lying exactly on the cut without re-evaluating its coordinates.
struct CutTag {
  uint64_t cut_id = 0;
  Position prev;
  Position next;

  bool operator==(const CutTag& b) const {
    return cut_id == b.cut_id && prev == b.prev && next == b.next;
  }
};

// A polygon vertex, either an original one or one synthesized by a cut.
struct Vertex {
  Position pos;
  std::optional<CutTag> tag;

  Vertex() = default;
  Vertex(const Position& pos)  // NOLINT: implicit for brace-init of rings.
    : pos(pos) {}
  Vertex(const Position& pos, CutTag tag)
    : pos(pos), tag(tag) {}

  bool IsCutVertex() const { return tag.has_value(); }

  bool operator==(const Vertex& b) const {
    return pos == b.pos && tag == b.tag;
  }
  bool operator!=(const Vertex& b) const { return !(*this == b); }
};

// A simple polygon given as a ring of vertices.  The ring is implicitly closed,
// the last vertex connects back to the first and isn't repeated.
class Polygon {
 public:
  Polygon() = default;
  explicit Polygon(std::vector<Vertex> vertices);

  // Builds a polygon from positions.  A trailing copy of the first position
  // (an explicitly closed ring) is dropped.
  static Polygon FromPositions(absl::Span<const Position> positions);

  const std::vector<Vertex>& vertices() const { return vertices_; }
  size_t size() const { return vertices_.size(); }
  bool empty() const { return vertices_.empty(); }

  const Vertex& operator[](size_t i) const { return vertices_[i]; }

  // Returns the positions of the ring, optionally repeating the first one at
  // the end.
  std::vector<Position> Positions(bool closed = false) const;

  // Number of vertices that weren't produced by a cut.
  int OriginalVertexCount() const;

  BoundingBox Bounds() const;

  // Shoelace area in square degrees, positive for counter-clockwise rings.
  double SignedArea() const;
  double Area() const { return std::abs(SignedArea()); }
  bool IsClockwise() const { return SignedArea() < 0; }

  // A polygon with fewer than three vertices or no area covers nothing and
  // is treated as empty.
  bool IsDegenerate() const;

  // Area-weighted centroid.  Falls back to the vertex average for degenerate
  // rings.
  Position Centroid() const;

  // Point in polygon test using ray casting.  Positions within a small epsilon
  // of a vertex are considered inside.
  bool Contains(const Position& p) const;

  // Returns a copy with every longitude shifted by `offset` degrees.
  Polygon Shifted(double offset) const;

  bool operator==(const Polygon& b) const { return vertices_ == b.vertices_; }
  bool operator!=(const Polygon& b) const { return !(*this == b); }

 private:
  std::vector<Vertex> vertices_;
};

// A set of polygons making up an event area.
using Area = std::vector<Polygon>;

// Sum of absolute polygon areas.
double TotalArea(absl::Span<const Polygon> area);

// Returns true if any polygon of the area contains the position.
bool AreaContains(absl::Span<const Polygon> area, const Position& p);

// Parses a polygon from text of the form "lat:lng, lat:lng, ...".
absl::StatusOr<Polygon> ParsePolygon(absl::string_view text);

// Parses a single "lat:lng" position.
absl::StatusOr<Position> ParsePosition(absl::string_view text);

}  // namespace surge
