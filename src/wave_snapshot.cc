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

#include "surge/wave/wave_snapshot.h"

namespace surge {

absl::string_view WaveModeName(WaveMode mode) {
  switch (mode) {
    case WaveMode::kAdd:       return "add";
    case WaveMode::kRecompose: return "recompose";
  }
  return "unknown";
}

void WaveSnapshot::ForEachTraversed(
  absl::FunctionRef<void(const Polygon&)> fn) const {
  std::vector<const TraversedLayer*> layers;
  for (const TraversedLayer* layer = traversed_layers.get(); layer;
       layer = layer->below.get()) {
    layers.push_back(layer);
  }

  for (auto it = layers.rbegin(); it != layers.rend(); ++it) {
    for (const Polygon& polygon : (*it)->pieces) {
      fn(polygon);
    }
  }
}

std::vector<Polygon> WaveSnapshot::Traversed() const {
  std::vector<Polygon> result;
  result.reserve(traversed_count());
  ForEachTraversed([&](const Polygon& polygon) {
    result.push_back(polygon);
  });
  return result;
}

WaveMode ChooseWaveMode(const WaveSnapshot* absl_nullable previous,
  absl::Time now, size_t front_count, absl::Duration recompose_after) {
  if (previous == nullptr) {
    return WaveMode::kRecompose;
  }

  // Fronts only move forward with time, going back would un-traverse area.
  if (now < previous->timestamp) {
    return WaveMode::kRecompose;
  }

  if (previous->fronts.size() != front_count) {
    return WaveMode::kRecompose;
  }

  if (now - previous->timestamp > recompose_after) {
    return WaveMode::kRecompose;
  }
  return WaveMode::kAdd;
}

}  // namespace surge
