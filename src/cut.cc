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

#include "surge/geometry/cut.h"

#include <algorithm>
#include <atomic>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"

namespace surge {

namespace {

// Limits on how often the slope of a front may change sign.
constexpr int kMaxSignChanges = 5;
constexpr int kMaxNonZeroSignChanges = 3;

int Sign(double v) {
  if (v > kCoordinateEpsilon) return +1;
  if (v < -kCoordinateEpsilon) return -1;
  return 0;
}

}  // namespace

uint64_t Cut::NextId() {
  static std::atomic<uint64_t> next_id = 1;
  return next_id.fetch_add(1, std::memory_order_relaxed);
}

Cut::Cut(uint64_t id, std::vector<Position> positions)
  : id_(id), positions_(std::move(positions)) {}

Cut Cut::Straight(double lng) {
  return Cut(NextId(), {Position(0, lng)});
}

Cut Cut::Composed(std::vector<Position> positions) {
  CHECK(!positions.empty()) << "a composed cut needs at least one position";

  std::stable_sort(positions.begin(), positions.end(),
    [](const Position& a, const Position& b) { return a.lat < b.lat; });

  // Drop all but the last of any run of equal latitudes.
  std::vector<Position> unique;
  unique.reserve(positions.size());
  for (const Position& p : positions) {
    if (!unique.empty() && unique.back().lat == p.lat) {
      unique.back() = p;
    } else {
      unique.emplace_back(p);
    }
  }
  return Cut(NextId(), std::move(unique));
}

double Cut::LongitudeAt(double lat) const {
  if (lat <= positions_.front().lat) {
    return positions_.front().lng;
  }
  if (lat >= positions_.back().lat) {
    return positions_.back().lng;
  }

  // First position strictly above lat, we know it's not the first one.
  auto hi = std::upper_bound(positions_.begin(), positions_.end(), lat,
    [](double lat, const Position& p) { return lat < p.lat; });
  auto lo = hi - 1;

  const double t = (lat - lo->lat)/(hi->lat - lo->lat);
  return lo->lng + t*(hi->lng - lo->lng);
}

Cut::Side Cut::SideOf(const Position& p) const {
  const double delta = p.lng - LongitudeAt(p.lat);
  if (delta < -kCoordinateEpsilon) {
    return Side::kWest;
  }
  if (delta > +kCoordinateEpsilon) {
    return Side::kEast;
  }
  return Side::kOn;
}

Cut::Side Cut::SideOf(const Vertex& v) const {
  if (v.tag && v.tag->cut_id == id_) {
    return Side::kOn;
  }
  return SideOf(v.pos);
}

std::vector<Position> Cut::BreakpointsBetween(double lat0, double lat1) const {
  std::vector<Position> result;
  if (IsStraight() || lat0 == lat1) {
    return result;
  }

  const double lo = std::min(lat0, lat1);
  const double hi = std::max(lat0, lat1);
  auto beg = std::upper_bound(positions_.begin(), positions_.end(), lo,
    [](double lat, const Position& p) { return lat < p.lat; });
  auto end = std::lower_bound(positions_.begin(), positions_.end(), hi,
    [](const Position& p, double lat) { return p.lat < lat; });

  if (beg < end) {
    result.assign(beg, end);
  }
  if (lat0 > lat1) {
    std::reverse(result.begin(), result.end());
  }
  return result;
}

interval Cut::LongitudeRange() const {
  auto [lo, hi] = std::minmax_element(positions_.begin(), positions_.end(),
    [](const Position& a, const Position& b) { return a.lng < b.lng; });
  return interval(lo->lng, hi->lng);
}

absl::Status Cut::ValidateArc() const {
  if (positions_.size() < 3) {
    return absl::OkStatus();
  }

  int sign_changes = 0;
  int nonzero_sign_changes = 0;
  int last = Sign(positions_[1].lng - positions_[0].lng);
  for (size_t i = 2; i < positions_.size(); ++i) {
    const int sign = Sign(positions_[i].lng - positions_[i-1].lng);
    if (sign != last) {
      ++sign_changes;
      if (sign != 0 && last != 0) {
        ++nonzero_sign_changes;
      }
    }
    last = sign;
  }

  if (sign_changes > kMaxSignChanges ||
      nonzero_sign_changes > kMaxNonZeroSignChanges) {
    return absl::FailedPreconditionError(absl::StrFormat(
      "cut %d is not a valid arc: %d slope changes (%d reversals)",
      id_, sign_changes, nonzero_sign_changes));
  }
  return absl::OkStatus();
}

}  // namespace surge
