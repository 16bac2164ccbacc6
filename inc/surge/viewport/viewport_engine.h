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

#include "surge/geometry/bounding_box.h"
#include "surge/viewport/viewport_constraints.h"

namespace surge {

// Keeps the camera constraints for one map view up to date as the renderer
// reports screen and camera changes.  Meant to be driven from the UI thread,
// it isn't thread safe.
//
// Small changes in screen or viewport size are ignored, so that the
// adjustments made in response don't feed back into a stream of updates.
class ViewportConstraintEngine {
 public:
  // Center bounds within this many degrees are considered unchanged.
  static constexpr double kSameBoundsTolerance = 0.001;

  ViewportConstraintEngine(const BoundingBox& event, FitMode mode,
    const ViewportOptions& options = {});

  // Notes a new screen size.  Returns true if the constraints were
  // recomputed.
  bool OnResize(const ScreenSize& screen);

  // Notes the area visible once the camera settles.  Returns the new
  // constraints if they changed.
  std::optional<ViewportConstraints> OnCameraIdle(const BoundingBox& viewport);

  // Switches fitting policy, recomputing the constraints.
  void SetFitMode(FitMode mode);

  // Returns the nearest allowed camera center.
  Position Clamp(const Position& proposed) const {
    return ClampCenter(proposed, constraints_.center_bounds);
  }

  // Returns the nearest allowed zoom.
  double ClampZoom(double zoom) const;

  const ViewportConstraints& constraints() const { return constraints_; }
  const BoundingBox& event() const { return event_; }
  FitMode mode() const { return mode_; }

 private:
  ViewportConstraints Compute() const;

  BoundingBox event_;
  FitMode mode_;
  ViewportOptions options_;

  std::optional<ScreenSize> screen_;
  std::optional<BoundingBox> viewport_;
  ViewportConstraints constraints_;
};

}  // namespace surge
