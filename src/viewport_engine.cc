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

#include "surge/viewport/viewport_engine.h"

#include <algorithm>
#include <cmath>

#include "absl/log/log.h"

namespace surge {

ViewportConstraintEngine::ViewportConstraintEngine(const BoundingBox& event,
  FitMode mode, const ViewportOptions& options)
  : event_(event), mode_(mode), options_(options) {
  constraints_.center_bounds = event_;
}

ViewportConstraints ViewportConstraintEngine::Compute() const {
  if (!screen_) {
    ViewportConstraints neutral;
    neutral.center_bounds = event_;
    return neutral;
  }
  return ComputeViewportConstraints(event_, *screen_, mode_, viewport_, options_);
}

bool ViewportConstraintEngine::OnResize(const ScreenSize& screen) {
  if (screen_ && !HasSignificantResize(*screen_, screen, options_.significant_change)) {
    return false;
  }

  screen_ = screen;
  constraints_ = Compute();
  VLOG(1) << "Screen resized to " << screen.width << "x" << screen.height
          << ", min zoom " << constraints_.min_zoom
          << ", center bounds " << constraints_.center_bounds;
  return true;
}

std::optional<ViewportConstraints> ViewportConstraintEngine::OnCameraIdle(
  const BoundingBox& viewport) {
  if (viewport_ && !HasSignificantChange(viewport_->ToRegion(),
        viewport.ToRegion(), options_.significant_change)) {
    return std::nullopt;
  }
  viewport_ = viewport;

  const ViewportConstraints next = Compute();
  if (next.valid == constraints_.valid &&
      next.padded == constraints_.padded &&
      std::abs(next.min_zoom - constraints_.min_zoom) < kSameBoundsTolerance &&
      next.center_bounds.ApproxEquals(constraints_.center_bounds, kSameBoundsTolerance)) {
    return std::nullopt;
  }

  constraints_ = next;
  VLOG(1) << "Camera bounds now " << constraints_.center_bounds;
  return constraints_;
}

void ViewportConstraintEngine::SetFitMode(FitMode mode) {
  mode_ = mode;
  constraints_ = Compute();
}

double ViewportConstraintEngine::ClampZoom(double zoom) const {
  if (!constraints_.valid) {
    return zoom;
  }
  return std::max(zoom, constraints_.min_zoom);
}

}  // namespace surge
