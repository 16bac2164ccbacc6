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

#include "absl/types/span.h"

#include "surge/geometry/cut.h"
#include "surge/geometry/polygon.h"

namespace surge {

// Polygons on either side of a cut.  Left is west of the cut, right is east.
struct SplitResult {
  std::vector<Polygon> left;
  std::vector<Polygon> right;
};

// Splits a polygon along a cut.
//
// Every edge crossing the cut gets a new vertex, tagged with the cut, where it
// meets the line.  Intersections are always interpolated starting from the
// lesser endpoint of an edge so that the shared edge of two adjacent polygons
// produces bit-identical vertices.  The pieces on each side are then formed by
// walking the ring in its original order and stitching the chains on that
// side together along the cut, so the pieces keep the winding of the input.
//
// Vertices on the cut belong to both sides.  A polygon that doesn't cross the
// cut is returned unchanged on the side it lies on, and one lying entirely on
// the cut, or with fewer than three distinct vertices, yields nothing.
//
// Splitting a piece again with the same cut returns it unchanged.
SplitResult Split(const Polygon& polygon, const Cut& cut);

// Splits every polygon of an area, concatenating the pieces.
SplitResult SplitArea(absl::Span<const Polygon> area, const Cut& cut);

}  // namespace surge
