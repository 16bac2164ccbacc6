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

#include "surge/wave/wave_front.h"

#include <algorithm>
#include <cmath>
#include <variant>

#include "absl/log/check.h"
#include "absl/status/status.h"

namespace surge {

namespace {

// Slices shorter than this, in meters, are considered to have no length.
constexpr double kMinSliceLength = 1e-6;

// Fraction of a slice of the given length covered after `distance` meters.
// Near the poles a slice has no length and the front crosses it instantly.
double SweptFraction(double distance, double length) {
  if (length < kMinSliceLength) {
    return distance > 0 ? 1 : 0;
  }
  return std::clamp(distance/length, 0.0, 1.0);
}

}  // namespace

WaveGeometry::WaveGeometry(const WaveDefinition& definition,
  const BoundingBox& bbox, double band_step, int max_bands)
  : curved_(!std::holds_alternative<DeepWave>(definition)),
    direction_(WaveDirection(definition)),
    speed_(WaveSpeed(definition)),
    bbox_(bbox) {
  CHECK_GT(speed_, 0);
  CHECK_GT(band_step, 0);
  CHECK_GT(max_bands, 0);

  const int count = FrontCount(definition);
  CHECK_GT(count, 0);
  const interval lngs = bbox_.LongitudeInterval();
  for (int i = 0; i < count; ++i) {
    slices_.emplace_back(
      lngs.lerp(static_cast<double>(i+0)/count),
      lngs.lerp(static_cast<double>(i+1)/count));
  }

  // Every slice has the same width, so one set of band lengths serves them all.
  if (curved_) {
    const interval lats = bbox_.LatitudeInterval();
    const int bands = std::clamp(
      static_cast<int>(std::ceil(lats.length()/band_step)), 1, max_bands);
    for (int i = 0; i <= bands; ++i) {
      const double lat = lats.lerp(static_cast<double>(i)/bands);
      band_lats_.push_back(lat);
      band_lengths_.push_back(SliceLength(lat));
    }
  }

  const double widest = SliceLength(bbox_.LatitudeOfWidestPart());
  total_duration_ = absl::Seconds(widest/speed_);
}

double WaveGeometry::ReferenceLatitude(double lat) const {
  return curved_ ? lat : bbox_.LatitudeOfWidestPart();
}

double WaveGeometry::SliceLength(double lat) const {
  const interval& slice = slices_.front();
  return std::abs(ParallelDistance(slice.v0(), slice.v1(), lat));
}

int WaveGeometry::SliceFor(double lng) const {
  const interval lngs = bbox_.LongitudeInterval();
  const int count = slice_count();
  const int index = static_cast<int>(std::floor(lngs.fraction(lng)*count));
  return std::clamp(index, 0, count - 1);
}

int WaveGeometry::LeadingSlice() const {
  return direction_ == Direction::kEast ? 0 : slice_count() - 1;
}

double WaveGeometry::FrontLongitude(int slice, double lat, double distance) const {
  const interval& s = slices_[slice];
  double fraction = SweptFraction(distance, SliceLength(ReferenceLatitude(lat)));
  if (direction_ == Direction::kWest) {
    fraction = 1 - fraction;
  }
  return s.lerp(fraction);
}

double WaveGeometry::DistanceFromStart(int slice, const Position& p) const {
  const interval& s = slices_[slice];
  const double lng = bbox_.UnwrapLongitude(p.lng);

  double fraction = s.fraction(lng);
  if (direction_ == Direction::kWest) {
    fraction = 1 - fraction;
  }
  return fraction*SliceLength(ReferenceLatitude(p.lat));
}

double WaveGeometry::Fraction(int slice, const Position& p) const {
  const interval& s = slices_[slice];
  double fraction = s.fraction(bbox_.UnwrapLongitude(p.lng));
  if (direction_ == Direction::kWest) {
    fraction = 1 - fraction;
  }
  return std::clamp(fraction, 0.0, 1.0);
}

std::vector<WaveFront> WaveGeometry::Fronts(double distance) const {
  std::vector<WaveFront> fronts;
  fronts.reserve(slices_.size());

  for (int i = 0; i < slice_count(); ++i) {
    if (!curved_) {
      const double lng = FrontLongitude(i, 0, distance);
      fronts.push_back({Cut::Straight(lng), slices_[i]});
      continue;
    }

    const interval& s = slices_[i];
    std::vector<Position> positions;
    positions.reserve(band_lats_.size());
    for (size_t b = 0; b < band_lats_.size(); ++b) {
      double fraction = SweptFraction(distance, band_lengths_[b]);
      if (direction_ == Direction::kWest) {
        fraction = 1 - fraction;
      }
      positions.emplace_back(band_lats_[b], s.lerp(fraction));
    }
    Cut cut = Cut::Composed(std::move(positions));
    DCHECK_OK(cut.ValidateArc());
    fronts.push_back({std::move(cut), s});
  }
  return fronts;
}

}  // namespace surge
