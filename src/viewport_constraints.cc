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

#include "surge/viewport/viewport_constraints.h"

#include <algorithm>
#include <cmath>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"

namespace surge {

absl::string_view FitModeName(FitMode mode) {
  switch (mode) {
    case FitMode::kTightFit:  return "tight";
    case FitMode::kAspectFit: return "aspect";
  }
  return "unknown";
}

bool AbslParseFlag(absl::string_view text, FitMode* mode, std::string* error) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "tight") {
    *mode = FitMode::kTightFit;
    return true;
  }
  if (lower == "aspect") {
    *mode = FitMode::kAspectFit;
    return true;
  }
  *error = absl::StrFormat("unknown fit mode '%s', expected tight or aspect", text);
  return false;
}

std::string AbslUnparseFlag(FitMode mode) {
  return std::string(FitModeName(mode));
}

double ZoomForSpan(double span, double pixels, double tile_size) {
  return std::log2(pixels*360.0/(span*tile_size));
}

BoundingBox ViewportExtentAtZoom(const Position& center, double zoom,
  const ScreenSize& screen, double tile_size) {
  const double degrees_per_pixel = 360.0/(tile_size*std::exp2(zoom));
  const vec2 half(
    screen.width*degrees_per_pixel/2,
    screen.height*degrees_per_pixel/2);

  const pnt2 c = center.xy();
  return BoundingBox::FromRegion(region2(c - half, c + half));
}

double MinimumZoom(const BoundingBox& event, const ScreenSize& screen,
  FitMode mode, const ViewportOptions& options) {
  const double width  = event.width();
  const double height = event.height();

  switch (mode) {
    case FitMode::kTightFit:
      // Zoom out far enough that both dimensions fit.
      return std::min(
        ZoomForSpan(width,  screen.width,  options.tile_size),
        ZoomForSpan(height, screen.height, options.tile_size));

    case FitMode::kAspectFit: {
      // Fit the constraining dimension exactly, narrowing the other one to
      // the screen's proportions.
      double zoom;
      if (width/height > screen.aspect()) {
        const double narrowed = height*screen.aspect();
        zoom = ZoomForSpan(narrowed, screen.width, options.tile_size);
      } else {
        const double narrowed = width/screen.aspect();
        zoom = ZoomForSpan(narrowed, screen.height, options.tile_size);
      }
      return zoom + options.aspect_fit_zoom_margin;
    }
  }
  return 0;
}

ViewportConstraints ComputeViewportConstraints(const BoundingBox& event,
  const ScreenSize& screen, FitMode mode,
  const std::optional<BoundingBox>& viewport, const ViewportOptions& options) {
  ViewportConstraints constraints;
  constraints.center_bounds = event;

  if (!screen.IsValid() || event.IsEmpty() ||
      !std::isfinite(screen.width) || !std::isfinite(screen.height)) {
    VLOG(1) << "Neutral viewport constraints for screen " << screen.width
            << "x" << screen.height << " and event " << event;
    return constraints;
  }

  constraints.valid = true;
  constraints.min_zoom = MinimumZoom(event, screen, mode, options);

  vec2 padding(0, 0);
  if (viewport && !viewport->IsEmpty()) {
    const vec2 half(viewport->width()/2, viewport->height()/2);
    if (half[0] > options.max_viewport_half_extent ||
        half[1] > options.max_viewport_half_extent) {
      LOG_EVERY_N_SEC(WARNING, 10) << "Ignoring implausible viewport " << *viewport;
    } else {
      padding = half;
      constraints.padded = true;
    }
  }

  constraints.center_bounds =
    BoundingBox::FromRegion(erode(event.ToRegion(), padding));
  return constraints;
}

Position ClampCenter(const Position& proposed, const BoundingBox& bounds) {
  const pnt2 p(bounds.UnwrapLongitude(proposed.lng), proposed.lat);
  const pnt2 clamped = bounds.ToRegion().clamp(p);
  if (clamped == p) {
    return proposed;
  }

  double lng = clamped[0];
  if (lng > 180.0) {
    lng -= 360.0;
  }
  return Position(clamped[1], lng);
}

bool HasSignificantChange(const region2& before, const region2& after,
  double threshold) {
  return relative_change(before.xinterval(), after.xinterval()) > threshold ||
         relative_change(before.yinterval(), after.yinterval()) > threshold;
}

bool HasSignificantResize(const ScreenSize& before, const ScreenSize& after,
  double threshold) {
  return HasSignificantChange(
    region2(pnt2(0, 0), pnt2(before.width, before.height)),
    region2(pnt2(0, 0), pnt2(after.width, after.height)),
    threshold);
}

}  // namespace surge
