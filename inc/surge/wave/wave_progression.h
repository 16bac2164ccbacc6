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
#include <optional>
#include <vector>

#include "absl/base/nullability.h"
#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "surge/geometry/bounding_box.h"
#include "surge/geometry/polygon.h"
#include "surge/wave/clock.h"
#include "surge/wave/wave_definition.h"
#include "surge/wave/wave_front.h"
#include "surge/wave/wave_snapshot.h"

namespace surge {

struct WaveProgressionOptions {
  // Snapshots older than this are rebuilt from scratch rather than extended.
  absl::Duration recompose_after = absl::Seconds(60);

  // Latitude spacing and limit for bands approximating curved fronts.
  double band_step = WaveGeometry::kDefaultBandStep;
  int max_bands = WaveGeometry::kDefaultMaxBands;
};

// Tracks a wave sweeping across an event area.
//
// The wave starts at `start` on one edge of the bounding box and moves across
// it at a fixed ground speed.  Every query reads the time from the injected
// clock, so the same instance serves live, simulated and test playback.
//
// Queries are const and thread safe.  The only state carried between calls is
// the previous snapshot returned by WavePolygons(), which lets the next call
// split just the part of the area the wave hasn't reached yet.
class WaveProgression {
 public:
  using Options = WaveProgressionOptions;

  enum class Phase { kNotStarted, kInProgress, kCompleted };

  // Where a user stands relative to the front while the wave is running.
  enum class HitState { kNone, kWarming, kAboutToBeHit, kHit };

  // Users this close to being hit are warming up.
  static constexpr absl::Duration kWarmingDuration = absl::Seconds(150);
  // Users this close to being hit are warned.
  static constexpr absl::Duration kWarnBeforeHit = absl::Seconds(30);

  // The bounding box is taken as given; an area crossing the antimeridian must
  // come with a box that wraps.  The clock must outlive this object.
  WaveProgression(WaveDefinition definition, Area area, const BoundingBox& bbox,
    absl::Time start, const Clock* absl_nonnull clock, Options options = {});

  // Validates a configuration and builds a progression over the area's
  // bounding box.
  static absl::StatusOr<std::unique_ptr<WaveProgression>> Create(
    const WaveConfig& config, Area area, absl::Time start,
    const Clock* absl_nonnull clock, Options options = {});

  const WaveDefinition& definition() const { return definition_; }
  const BoundingBox& bbox() const { return geometry_.bbox(); }
  const Area& area() const { return area_; }

  absl::Time start_time() const { return start_; }
  absl::Time end_time() const { return start_ + TotalDuration(); }
  absl::Duration TotalDuration() const { return geometry_.TotalDuration(); }

  Phase GetPhase() const;

  // Percentage of the total duration elapsed, in [0, 100].
  double Progression() const;

  // Longitude of the front at a latitude.  For a split wave the reference
  // longitude picks the slice, by default the one the wave starts in.
  double ClosestWaveLongitude(double lat,
    std::optional<double> reference_lng = std::nullopt) const;

  // The fronts as of now.
  std::vector<WaveFront> CurrentFronts() const;

  // Splits the area into traversed and remaining polygons as of now.  Returns
  // null when the area is empty or the wave hasn't started.
  std::shared_ptr<const WaveSnapshot> WavePolygons();

  // The snapshot returned by the last call to WavePolygons(), if any.
  std::shared_ptr<const WaveSnapshot> PreviousSnapshot() const;

  // Forgets the previous snapshot so that the next one is built from scratch.
  void Reset();

  // Time left until the front reaches a user, negative once it has.  Null
  // without a position or when there's no area.
  std::optional<absl::Duration> TimeBeforeUserHit(
    const std::optional<Position>& user) const;

  // Instant at which the front reaches a user.
  std::optional<absl::Time> UserHitTime(
    const std::optional<Position>& user) const;

  // How far across its slice of the area a user is, from 0 at the start edge
  // to 1 at the far edge.
  std::optional<double> UserPositionRatio(
    const std::optional<Position>& user) const;

  // True if the user is within the area and the front has passed them.
  bool HasUserBeenHit(const std::optional<Position>& user) const;

  HitState UserHitState(const std::optional<Position>& user) const;

  // How long a poll loop should wait before the next query: coarse while the
  // wave is far off, fine once it's running and about to reach the user.
  // Infinite once the wave has completed.
  absl::Duration ObservationInterval(
    const std::optional<Position>& user = std::nullopt) const;

 private:
  // Distance travelled by the fronts at an instant, zero before the start.
  double Distance(absl::Time now) const;

  // Splits `polygons` by a front.  Covered pieces go to `traversed` and the
  // rest to the remaining set of `snapshot`.
  void Sweep(const WaveFront& front, int index, absl::Span<const Polygon> polygons,
    std::vector<Polygon>* traversed, WaveSnapshot* snapshot) const;

  WaveDefinition definition_;
  Area area_;
  absl::Time start_;
  const Clock* absl_nonnull clock_;
  Options options_;
  WaveGeometry geometry_;

  // The area pre-cut into the slices of a split wave.
  std::vector<Area> sliced_area_;

  mutable absl::Mutex snapshot_lock_;
  std::shared_ptr<const WaveSnapshot> previous_ ABSL_GUARDED_BY(snapshot_lock_);
};

absl::string_view PhaseName(WaveProgression::Phase phase);
absl::string_view HitStateName(WaveProgression::HitState state);

}  // namespace surge
