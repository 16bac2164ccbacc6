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

// Plays a wave over an event area and reports its progress.
//
//   surge_sim --area="48.80:2.25, 48.80:2.42, 48.90:2.42, 48.90:2.25" \
//     --speed=50 --direction=west --user=48.85:2.35

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

// External requirements
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

// Project requirements
#include "surge/geometry/polygon.h"
#include "surge/strutil.h"
#include "surge/viewport/viewport_constraints.h"
#include "surge/wave/clock.h"
#include "surge/wave/wave_definition.h"
#include "surge/wave/wave_progression.h"
#include "surge/wave/wave_snapshot.h"

ABSL_FLAG(std::string, area, "10:20, 10:30, 15:30, 15:20",
  "Event area as lat:lng pairs, with ';' between polygons");
ABSL_FLAG(surge::WaveKind, kind, surge::WaveKind::kLinear,
  "Wave kind: linear, deep or split");
ABSL_FLAG(double, speed, 100, "Wave speed in meters per second");
ABSL_FLAG(surge::Direction, direction, surge::Direction::kEast,
  "Direction of travel: east or west");
ABSL_FLAG(int, splits, 2, "Number of slices for a split wave");
ABSL_FLAG(absl::Duration, start_in, absl::ZeroDuration(),
  "Delay before the wave starts");
ABSL_FLAG(std::string, user, "", "Position of a user to track, as lat:lng");
ABSL_FLAG(absl::Duration, step, absl::Minutes(10),
  "Simulated time between reports when not running in real time");
ABSL_FLAG(bool, realtime, false,
  "Follow a simulated clock and the wave's observation interval");
ABSL_FLAG(double, sim_speed, 60, "Speed factor of the clock with --realtime");
ABSL_FLAG(surge::FitMode, fit, surge::FitMode::kAspectFit,
  "Viewport fit mode to report: tight or aspect");
ABSL_FLAG(double, screen_width, 1080, "Screen width in pixels");
ABSL_FLAG(double, screen_height, 1920, "Screen height in pixels");

namespace surge {
namespace {

// Builds a wave configuration from the command line.
WaveConfig ConfigFromFlags() {
  WaveConfig config;
  const double speed = absl::GetFlag(FLAGS_speed);
  const Direction direction = absl::GetFlag(FLAGS_direction);

  switch (absl::GetFlag(FLAGS_kind)) {
    case WaveKind::kLinear:
      config.linear = LinearWave{speed, direction};
      break;
    case WaveKind::kDeep:
      config.deep = DeepWave{speed, direction};
      break;
    case WaveKind::kLinearSplit:
      config.linear_split = LinearSplitWave{speed, direction,
        absl::GetFlag(FLAGS_splits)};
      break;
  }
  return config;
}

absl::StatusOr<Area> AreaFromFlags() {
  Area area;
  const std::string text = absl::GetFlag(FLAGS_area);
  for (absl::string_view entry : absl::StrSplit(text, ';', absl::SkipWhitespace())) {
    absl::StatusOr<Polygon> polygon = ParsePolygon(entry);
    if (!polygon.ok()) {
      return polygon.status();
    }
    area.push_back(*std::move(polygon));
  }
  return area;
}

absl::StatusOr<std::optional<Position>> UserFromFlags() {
  const std::string text = absl::GetFlag(FLAGS_user);
  if (text.empty()) {
    return std::nullopt;
  }
  absl::StatusOr<Position> user = ParsePosition(text);
  if (!user.ok()) {
    return user.status();
  }
  return std::optional<Position>(*user);
}

void ReportViewport(const BoundingBox& bbox) {
  const ScreenSize screen = {
    absl::GetFlag(FLAGS_screen_width),
    absl::GetFlag(FLAGS_screen_height)
  };
  const FitMode mode = absl::GetFlag(FLAGS_fit);

  const ViewportConstraints constraints =
    ComputeViewportConstraints(bbox, screen, mode, std::nullopt);
  if (!constraints.valid) {
    LOG(WARNING) << "No viewport constraints for event " << bbox;
    return;
  }

  absl::PrintF("viewport (%s fit): min zoom %.2f, camera bounds %v\n",
    FitModeName(mode), constraints.min_zoom, constraints.center_bounds);
}

double TraversedArea(const WaveSnapshot& snapshot) {
  double area = 0;
  snapshot.ForEachTraversed([&](const Polygon& polygon) {
    area += polygon.Area();
  });
  return area;
}

void Report(WaveProgression* wave, const Clock& clock,
  const std::optional<Position>& user) {
  const absl::Time now = clock.Now();
  const Position center = wave->bbox().center();

  std::string line = absl::StrFormat(
    "%s  %-11s %6.2f%%  front %.4f",
    absl::FormatTime("%H:%M:%S", now, absl::UTCTimeZone()),
    PhaseName(wave->GetPhase()), wave->Progression(),
    wave->ClosestWaveLongitude(center.lat));

  std::shared_ptr<const WaveSnapshot> snapshot = wave->WavePolygons();
  if (snapshot) {
    absl::StrAppendFormat(&line, "  %s: %d traversed (%.4f) %d remaining (%.4f)",
      WaveModeName(snapshot->mode),
      snapshot->traversed_count(), TraversedArea(*snapshot),
      snapshot->remaining.size(), TotalArea(snapshot->remaining));
  }

  if (user) {
    std::optional<absl::Duration> eta = wave->TimeBeforeUserHit(user);
    if (eta) {
      absl::StrAppendFormat(&line, "  user %s in %s",
        HitStateName(wave->UserHitState(user)), ShortDuration(*eta));
    }
  }
  absl::PrintF("%s\n", line);
}

int Run() {
  absl::StatusOr<Area> area = AreaFromFlags();
  if (!area.ok()) {
    LOG(ERROR) << "Bad --area: " << area.status();
    return EXIT_FAILURE;
  }

  absl::StatusOr<std::optional<Position>> user = UserFromFlags();
  if (!user.ok()) {
    LOG(ERROR) << "Bad --user: " << user.status();
    return EXIT_FAILURE;
  }

  const double sim_speed = absl::GetFlag(FLAGS_sim_speed);
  if (!(sim_speed > 0)) {
    LOG(ERROR) << "--sim_speed must be positive, got " << sim_speed;
    return EXIT_FAILURE;
  }

  const absl::Duration step = absl::GetFlag(FLAGS_step);
  if (step <= absl::ZeroDuration()) {
    LOG(ERROR) << "--step must be positive";
    return EXIT_FAILURE;
  }

  // The simulation starts at the epoch, the wave after --start_in.
  const absl::Time epoch = absl::FromUnixSeconds(0);
  const absl::Time start = epoch + absl::GetFlag(FLAGS_start_in);

  ManualClock manual(epoch);
  std::unique_ptr<SimulatedClock> simulated;
  const Clock* clock = &manual;
  if (absl::GetFlag(FLAGS_realtime)) {
    simulated = std::make_unique<SimulatedClock>(epoch, sim_speed);
    clock = simulated.get();
  }

  absl::StatusOr<std::unique_ptr<WaveProgression>> wave =
    WaveProgression::Create(ConfigFromFlags(), *std::move(area), start, clock);
  if (!wave.ok()) {
    LOG(ERROR) << "Invalid wave: " << wave.status();
    return EXIT_FAILURE;
  }

  LOG(INFO) << absl::StrFormat("%s wave heading %s over %v, crossing %s in %s",
    WaveKindName((*wave)->definition()),
    DirectionName(WaveDirection((*wave)->definition())),
    (*wave)->bbox(),
    engnot(WaveSpeed((*wave)->definition())*
      absl::ToDoubleSeconds((*wave)->TotalDuration()), "m"),
    ShortDuration((*wave)->TotalDuration()));

  ReportViewport((*wave)->bbox());

  while (true) {
    Report(wave->get(), *clock, *user);
    if ((*wave)->GetPhase() == WaveProgression::Phase::kCompleted) {
      break;
    }

    if (simulated) {
      absl::SleepFor((*wave)->ObservationInterval(*user)/sim_speed);
    } else {
      manual.Advance(step);
    }
  }
  return EXIT_SUCCESS;
}

}  // namespace
}  // namespace surge

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage("Plays a wave over an event area.");
  absl::ParseCommandLine(argc, argv);
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  absl::InitializeLog();
  return surge::Run();
}
