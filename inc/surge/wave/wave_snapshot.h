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

#include <memory>
#include <vector>

#include "absl/base/nullability.h"
#include "absl/functional/function_ref.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

#include "surge/geometry/polygon.h"
#include "surge/wave/wave_front.h"

namespace surge {

// How a snapshot was derived.
//
//   kAdd       - only the previous remaining polygons were split by the new
//                fronts, the newly traversed pieces were appended to the
//                previous traversed set.
//
//   kRecompose - the whole area was split from scratch.
enum class WaveMode { kAdd, kRecompose };

absl::string_view WaveModeName(WaveMode mode);

// Pieces covered by the wave, stacked one layer per snapshot.  An incremental
// snapshot adds a layer on top of its predecessor's and shares everything
// below it.
struct TraversedLayer {
  std::vector<Polygon> pieces;
  std::shared_ptr<const TraversedLayer> below;

  // Pieces in this layer and every layer below it.
  size_t total = 0;
};

// The state of the area at one instant.  Never modified once published.
struct WaveSnapshot {
  absl::Time timestamp;
  WaveMode mode = WaveMode::kRecompose;
  std::vector<WaveFront> fronts;

  std::shared_ptr<const TraversedLayer> traversed_layers;
  std::vector<Polygon> remaining;

  // Index of the front each remaining polygon is waiting on, parallel to
  // `remaining`.
  std::vector<int> remaining_front;

  // Number of traversed polygons new in this snapshot.  They come last in
  // Traversed().
  size_t added = 0;

  size_t traversed_count() const {
    return traversed_layers ? traversed_layers->total : 0;
  }

  // Visits every traversed polygon, oldest layer first.
  void ForEachTraversed(absl::FunctionRef<void(const Polygon&)> fn) const;

  // Copies out every traversed polygon, oldest layer first.
  std::vector<Polygon> Traversed() const;
};

// Decides whether the next snapshot can be built incrementally from the
// previous one.  A full recompose is needed when there's no previous snapshot,
// when the clock went backwards, when the fronts changed shape, or when the
// previous snapshot is older than `recompose_after`.  The age limit bounds how
// many small slivers the traversed set accumulates.
WaveMode ChooseWaveMode(const WaveSnapshot* absl_nullable previous,
  absl::Time now, size_t front_count, absl::Duration recompose_after);

}  // namespace surge
