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

#include "surge/geometry/polygon.h"

#include <cmath>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

namespace surge {

namespace {

// Distance to a vertex under which a point counts as on the polygon.
constexpr double kVertexEpsilon = 1e-12;

// Rings with less area than this (in square degrees) are degenerate.
constexpr double kMinArea = 1e-18;

}  // namespace

Polygon::Polygon(std::vector<Vertex> vertices)
  : vertices_(std::move(vertices)) {}

Polygon Polygon::FromPositions(absl::Span<const Position> positions) {
  size_t n = positions.size();
  if (n > 1 && positions.front() == positions.back()) {
    --n;
  }

  std::vector<Vertex> vertices;
  vertices.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    vertices.emplace_back(positions[i]);
  }
  return Polygon(std::move(vertices));
}

std::vector<Position> Polygon::Positions(bool closed) const {
  std::vector<Position> positions;
  positions.reserve(vertices_.size() + 1);
  for (const Vertex& v : vertices_) {
    positions.emplace_back(v.pos);
  }
  if (closed && !positions.empty()) {
    positions.emplace_back(positions.front());
  }
  return positions;
}

int Polygon::OriginalVertexCount() const {
  int count = 0;
  for (const Vertex& v : vertices_) {
    count += !v.IsCutVertex();
  }
  return count;
}

BoundingBox Polygon::Bounds() const {
  return BoundingBox::FromPositions(Positions());
}

double Polygon::SignedArea() const {
  const size_t n = vertices_.size();
  if (n < 3) {
    return 0;
  }

  // Shoelace sum relative to the first vertex to limit cancellation.
  const pnt2 origin = vertices_[0].pos.xy();
  double sum = 0;
  for (size_t i = 1; i + 1 < n; ++i) {
    const pnt2 a = vertices_[i+0].pos.xy() - origin;
    const pnt2 b = vertices_[i+1].pos.xy() - origin;
    sum += a[0]*b[1] - a[1]*b[0];
  }
  return sum/2;
}

bool Polygon::IsDegenerate() const {
  return vertices_.size() < 3 || !(Area() > kMinArea);
}

Position Polygon::Centroid() const {
  const size_t n = vertices_.size();
  if (n == 0) {
    return Position();
  }

  const pnt2 origin = vertices_[0].pos.xy();
  const double area = SignedArea();
  if (n < 3 || std::abs(area) <= kMinArea) {
    pnt2 sum(0, 0);
    for (const Vertex& v : vertices_) {
      sum += v.pos.xy() - origin;
    }
    return Position::FromXY(origin + sum/static_cast<double>(n));
  }

  pnt2 sum(0, 0);
  for (size_t i = 1; i + 1 < n; ++i) {
    const pnt2 a = vertices_[i+0].pos.xy() - origin;
    const pnt2 b = vertices_[i+1].pos.xy() - origin;
    const double cross = a[0]*b[1] - a[1]*b[0];
    sum += (a + b)*cross;
  }
  return Position::FromXY(origin + sum/(6*area));
}

bool Polygon::Contains(const Position& p) const {
  const size_t n = vertices_.size();
  if (n < 3) {
    return false;
  }

  bool inside = false;
  for (size_t i = 0, j = n - 1; i < n; j = i++) {
    const Position& a = vertices_[i].pos;
    const Position& b = vertices_[j].pos;

    if (std::abs(a.lat - p.lat) < kVertexEpsilon &&
        std::abs(a.lng - p.lng) < kVertexEpsilon) {
      return true;
    }

    if ((a.lat > p.lat) != (b.lat > p.lat)) {
      const double x = a.lng + (p.lat - a.lat)*(b.lng - a.lng)/(b.lat - a.lat);
      if (p.lng < x) {
        inside = !inside;
      }
    }
  }
  return inside;
}

Polygon Polygon::Shifted(double offset) const {
  std::vector<Vertex> vertices = vertices_;
  for (Vertex& v : vertices) {
    v.pos.lng += offset;
  }
  return Polygon(std::move(vertices));
}

double TotalArea(absl::Span<const Polygon> area) {
  double total = 0;
  for (const Polygon& polygon : area) {
    total += polygon.Area();
  }
  return total;
}

bool AreaContains(absl::Span<const Polygon> area, const Position& p) {
  for (const Polygon& polygon : area) {
    if (polygon.Contains(p)) {
      return true;
    }
  }
  return false;
}

absl::StatusOr<Position> ParsePosition(absl::string_view text) {
  std::vector<absl::string_view> parts = absl::StrSplit(text, ':');
  if (parts.size() != 2) {
    return absl::InvalidArgumentError(
      absl::StrFormat("expected lat:lng, got '%s'", text));
  }

  Position p;
  if (!absl::SimpleAtod(absl::StripAsciiWhitespace(parts[0]), &p.lat) ||
      !absl::SimpleAtod(absl::StripAsciiWhitespace(parts[1]), &p.lng)) {
    return absl::InvalidArgumentError(
      absl::StrFormat("invalid coordinate in '%s'", text));
  }

  if (!p.IsValid()) {
    return absl::InvalidArgumentError(
      absl::StrFormat("position out of range: '%s'", text));
  }
  return p;
}

absl::StatusOr<Polygon> ParsePolygon(absl::string_view text) {
  std::vector<Position> positions;
  for (absl::string_view token : absl::StrSplit(text, ',', absl::SkipWhitespace())) {
    absl::StatusOr<Position> p = ParsePosition(token);
    if (!p.ok()) {
      return p.status();
    }
    positions.emplace_back(*p);
  }

  Polygon polygon = Polygon::FromPositions(positions);
  if (polygon.size() < 3) {
    return absl::InvalidArgumentError(
      absl::StrFormat("polygon needs at least 3 vertices, got %d", polygon.size()));
  }
  return polygon;
}

}  // namespace surge
