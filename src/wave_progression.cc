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

#include "surge/wave/wave_progression.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "absl/log/log.h"

#include "surge/geometry/polygon_splitter.h"

namespace surge {

namespace {

// Shifts every vertex onto the longitude range of the box so that an area
// across the antimeridian is contiguous.
Area UnwrapArea(Area area, const BoundingBox& bbox) {
  for (Polygon& polygon : area) {
    std::vector<Vertex> vertices = polygon.vertices();
    for (Vertex& v : vertices) {
      v.pos.lng = bbox.UnwrapLongitude(v.pos.lng);
    }
    polygon = Polygon(std::move(vertices));
  }
  return area;
}

// Cuts the area at the boundaries between the slices of the geometry.
std::vector<Area> SliceArea(const Area& area, const WaveGeometry& geometry) {
  std::vector<Area> sliced(geometry.slice_count());

  Area pool;
  for (const Polygon& polygon : area) {
    if (!polygon.IsDegenerate()) {
      pool.push_back(polygon);
    }
  }

  for (int i = 0; i + 1 < geometry.slice_count(); ++i) {
    SplitResult pieces = SplitArea(pool, Cut::Straight(geometry.Slice(i).v1()));
    sliced[i] = std::move(pieces.left);
    pool = std::move(pieces.right);
  }
  sliced.back() = std::move(pool);
  return sliced;
}

}  // namespace

absl::string_view PhaseName(WaveProgression::Phase phase) {
  switch (phase) {
    case WaveProgression::Phase::kNotStarted: return "not started";
    case WaveProgression::Phase::kInProgress: return "in progress";
    case WaveProgression::Phase::kCompleted:  return "completed";
  }
  return "unknown";
}

absl::string_view HitStateName(WaveProgression::HitState state) {
  switch (state) {
    case WaveProgression::HitState::kNone:         return "none";
    case WaveProgression::HitState::kWarming:      return "warming";
    case WaveProgression::HitState::kAboutToBeHit: return "about to be hit";
    case WaveProgression::HitState::kHit:          return "hit";
  }
  return "unknown";
}

WaveProgression::WaveProgression(WaveDefinition definition, Area area,
  const BoundingBox& bbox, absl::Time start, const Clock* absl_nonnull clock,
  Options options)
  : definition_(std::move(definition)),
    area_(UnwrapArea(std::move(area), bbox)),
    start_(start),
    clock_(clock),
    options_(options),
    geometry_(definition_, bbox, options.band_step, options.max_bands),
    sliced_area_(SliceArea(area_, geometry_)) {}

absl::StatusOr<std::unique_ptr<WaveProgression>> WaveProgression::Create(
  const WaveConfig& config, Area area, absl::Time start,
  const Clock* absl_nonnull clock, Options options) {
  absl::StatusOr<WaveDefinition> definition = MakeWaveDefinition(config);
  if (!definition.ok()) {
    return definition.status();
  }

  const BoundingBox bbox = BoundingBox::FromPolygons(area);
  return std::make_unique<WaveProgression>(
    *std::move(definition), std::move(area), bbox, start, clock, options);
}

double WaveProgression::Distance(absl::Time now) const {
  const double elapsed = absl::ToDoubleSeconds(now - start_);
  return std::max(0.0, elapsed)*geometry_.speed();
}

WaveProgression::Phase WaveProgression::GetPhase() const {
  const absl::Time now = clock_->Now();
  if (now < start_) {
    return Phase::kNotStarted;
  }
  if (now >= end_time()) {
    return Phase::kCompleted;
  }
  return Phase::kInProgress;
}

double WaveProgression::Progression() const {
  const absl::Duration elapsed = clock_->Now() - start_;
  const absl::Duration total = TotalDuration();
  if (elapsed <= absl::ZeroDuration()) {
    return 0;
  }
  if (total <= absl::ZeroDuration() || elapsed >= total) {
    return 100;
  }
  return std::clamp(100*absl::FDivDuration(elapsed, total), 0.0, 100.0);
}

double WaveProgression::ClosestWaveLongitude(double lat,
  std::optional<double> reference_lng) const {
  const int slice = reference_lng
    ? geometry_.SliceFor(bbox().UnwrapLongitude(*reference_lng))
    : geometry_.LeadingSlice();
  return geometry_.FrontLongitude(slice, lat, Distance(clock_->Now()));
}

std::vector<WaveFront> WaveProgression::CurrentFronts() const {
  return geometry_.Fronts(Distance(clock_->Now()));
}

void WaveProgression::Sweep(const WaveFront& front, int index,
  absl::Span<const Polygon> polygons, std::vector<Polygon>* traversed_out,
  WaveSnapshot* snapshot) const {
  SplitResult pieces = SplitArea(polygons, front.cut);

  // An eastward wave has covered what's west of its front.
  const bool east = geometry_.direction() == Direction::kEast;
  std::vector<Polygon>& traversed = east ? pieces.left : pieces.right;
  std::vector<Polygon>& remaining = east ? pieces.right : pieces.left;

  for (Polygon& polygon : traversed) {
    traversed_out->push_back(std::move(polygon));
  }
  for (Polygon& polygon : remaining) {
    snapshot->remaining.push_back(std::move(polygon));
    snapshot->remaining_front.push_back(index);
  }
}

std::shared_ptr<const WaveSnapshot> WaveProgression::WavePolygons() {
  if (area_.empty()) {
    return nullptr;
  }

  const absl::Time now = clock_->Now();
  if (now < start_) {
    return nullptr;
  }

  auto snapshot = std::make_shared<WaveSnapshot>();
  snapshot->timestamp = now;
  snapshot->fronts = geometry_.Fronts(Distance(now));

  absl::WriterMutexLock lock(&snapshot_lock_);
  snapshot->mode = ChooseWaveMode(previous_.get(), now,
    snapshot->fronts.size(), options_.recompose_after);

  auto layer = std::make_shared<TraversedLayer>();
  if (snapshot->mode == WaveMode::kRecompose) {
    for (size_t i = 0; i < snapshot->fronts.size(); ++i) {
      Sweep(snapshot->fronts[i], static_cast<int>(i), sliced_area_[i],
        &layer->pieces, snapshot.get());
    }
  } else {
    // Only the new pieces are stored, the rest is shared with the previous
    // snapshot.
    layer->below = previous_->traversed_layers;

    // Group the remaining polygons by the front they're waiting on.
    std::vector<Area> waiting(snapshot->fronts.size());
    for (size_t i = 0; i < previous_->remaining.size(); ++i) {
      waiting[previous_->remaining_front[i]].push_back(previous_->remaining[i]);
    }

    for (size_t i = 0; i < snapshot->fronts.size(); ++i) {
      Sweep(snapshot->fronts[i], static_cast<int>(i), waiting[i],
        &layer->pieces, snapshot.get());
    }
  }
  snapshot->added = layer->pieces.size();
  layer->total = layer->pieces.size() + (layer->below ? layer->below->total : 0);
  snapshot->traversed_layers = std::move(layer);

  VLOG(1) << "Wave snapshot at " << now << " (" << WaveModeName(snapshot->mode)
          << "): " << snapshot->traversed_count() << " traversed, "
          << snapshot->remaining.size() << " remaining, "
          << snapshot->added << " added";

  previous_ = snapshot;
  return snapshot;
}

std::shared_ptr<const WaveSnapshot> WaveProgression::PreviousSnapshot() const {
  absl::ReaderMutexLock lock(&snapshot_lock_);
  return previous_;
}

void WaveProgression::Reset() {
  absl::WriterMutexLock lock(&snapshot_lock_);
  previous_.reset();
}

std::optional<absl::Time> WaveProgression::UserHitTime(
  const std::optional<Position>& user) const {
  if (!user || area_.empty()) {
    return std::nullopt;
  }

  const int slice = geometry_.SliceFor(bbox().UnwrapLongitude(user->lng));
  const double distance = geometry_.DistanceFromStart(slice, *user);
  return start_ + absl::Seconds(distance/geometry_.speed());
}

std::optional<absl::Duration> WaveProgression::TimeBeforeUserHit(
  const std::optional<Position>& user) const {
  std::optional<absl::Time> hit = UserHitTime(user);
  if (!hit) {
    return std::nullopt;
  }
  return *hit - clock_->Now();
}

std::optional<double> WaveProgression::UserPositionRatio(
  const std::optional<Position>& user) const {
  if (!user || area_.empty()) {
    return std::nullopt;
  }
  const int slice = geometry_.SliceFor(bbox().UnwrapLongitude(user->lng));
  return geometry_.Fraction(slice, *user);
}

bool WaveProgression::HasUserBeenHit(const std::optional<Position>& user) const {
  if (!user || clock_->Now() < start_) {
    return false;
  }

  Position p = *user;
  p.lng = bbox().UnwrapLongitude(p.lng);
  if (!AreaContains(area_, p)) {
    return false;
  }

  std::optional<absl::Duration> remaining = TimeBeforeUserHit(user);
  return remaining && *remaining <= absl::ZeroDuration();
}

WaveProgression::HitState WaveProgression::UserHitState(
  const std::optional<Position>& user) const {
  if (!user) {
    return HitState::kNone;
  }
  if (HasUserBeenHit(user)) {
    return HitState::kHit;
  }
  if (GetPhase() != Phase::kInProgress) {
    return HitState::kNone;
  }

  Position p = *user;
  p.lng = bbox().UnwrapLongitude(p.lng);
  if (!AreaContains(area_, p)) {
    return HitState::kNone;
  }

  const std::optional<absl::Duration> remaining = TimeBeforeUserHit(user);
  if (!remaining) {
    return HitState::kNone;
  }
  if (*remaining <= kWarnBeforeHit) {
    return HitState::kAboutToBeHit;
  }
  if (*remaining <= kWarmingDuration) {
    return HitState::kWarming;
  }
  return HitState::kNone;
}

absl::Duration WaveProgression::ObservationInterval(
  const std::optional<Position>& user) const {
  const absl::Time now = clock_->Now();
  if (now >= end_time()) {
    return absl::InfiniteDuration();
  }

  const absl::Duration until_start = start_ - now;
  if (until_start > absl::Hours(1) + absl::Minutes(5)) {
    return absl::Hours(1);
  }
  if (until_start > absl::Minutes(5) + absl::Seconds(30)) {
    return absl::Minutes(5);
  }
  if (until_start > absl::Seconds(35)) {
    return absl::Seconds(1);
  }

  const std::optional<absl::Duration> hit = TimeBeforeUserHit(user);
  if (hit && *hit > absl::ZeroDuration() && *hit < absl::Seconds(5)) {
    return absl::Milliseconds(100);
  }
  return absl::Milliseconds(500);
}

}  // namespace surge
