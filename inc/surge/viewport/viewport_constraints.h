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

#include <optional>
#include <string>

#include "absl/strings/string_view.h"

#include "surge/geometry/bounding_box.h"
#include "surge/geometry/position.h"
#include "surge/geometry/region.h"

namespace surge {

// Zoom levels follow the usual web map convention: at zoom z the world is
// 256*2^z pixels around.  Viewports are treated as equirectangular, a pixel
// covers the same number of degrees horizontally and vertically.

// How the event area is fitted to the screen at minimum zoom.
//
//   kTightFit  - the whole area is visible, the screen may show some of the
//                surroundings along one axis.
//
//   kAspectFit - the area fills the screen along its constraining dimension,
//                the other dimension overflows and can be panned.  Nothing
//                outside the area is ever visible.
enum class FitMode { kTightFit, kAspectFit };

absl::string_view FitModeName(FitMode mode);

// Flag support, accepts "tight" and "aspect".
bool AbslParseFlag(absl::string_view text, FitMode* mode, std::string* error);
std::string AbslUnparseFlag(FitMode mode);

// Size of the map view in pixels.
struct ScreenSize {
  double width = 0;
  double height = 0;

  bool IsValid() const { return width > 0 && height > 0; }
  double aspect() const { return width/height; }
};

struct ViewportOptions {
  // Size of a map tile in pixels.
  double tile_size = 256;

  // Renderers report huge viewports before their first layout.  Viewports
  // whose half width or height exceeds this many degrees are ignored.
  double max_viewport_half_extent = 20;

  // Added to the minimum zoom in aspect fit mode.
  double aspect_fit_zoom_margin = 0;

  // Relative change in size below which a new screen or viewport is ignored.
  double significant_change = 0.1;
};

// Limits for the camera.  The camera may not zoom out past `min_zoom` and its
// center must stay within `center_bounds`.
struct ViewportConstraints {
  // False if the inputs were unusable, the constraints then restrict nothing
  // beyond keeping the center in the event area.
  bool valid = false;

  double min_zoom = 0;
  BoundingBox center_bounds;

  // True if the center bounds were shrunk by the current viewport.
  bool padded = false;
};

// Zoom at which `span` degrees fill `pixels` pixels.
double ZoomForSpan(double span, double pixels, double tile_size = 256);

// Area visible with the camera at a center and zoom.
BoundingBox ViewportExtentAtZoom(const Position& center, double zoom,
  const ScreenSize& screen, double tile_size = 256);

// Smallest zoom satisfying a fit mode.  The screen and event box must not be
// empty.
double MinimumZoom(const BoundingBox& event, const ScreenSize& screen,
  FitMode mode, const ViewportOptions& options = {});

// Computes the camera limits for an event area.
//
// The center bounds are the event box shrunk by half of the current viewport
// on each side, so that a camera centered anywhere inside them shows nothing
// outside the event.  Where the viewport is larger than the event along an
// axis, the bounds collapse to the middle.  Without a usable viewport the
// center bounds are the whole event box.
//
// Empty screens or event boxes give neutral constraints.
ViewportConstraints ComputeViewportConstraints(const BoundingBox& event,
  const ScreenSize& screen, FitMode mode,
  const std::optional<BoundingBox>& viewport,
  const ViewportOptions& options = {});

// Returns the position nearest to `proposed` inside `bounds`, clamping each
// axis independently.  Positions already inside are returned unchanged.
Position ClampCenter(const Position& proposed, const BoundingBox& bounds);

// True if the width or height changed by more than `threshold` relative to
// their old values.
bool HasSignificantChange(const region2& before, const region2& after,
  double threshold);

bool HasSignificantResize(const ScreenSize& before, const ScreenSize& after,
  double threshold);

}  // namespace surge
