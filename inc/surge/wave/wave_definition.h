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
#include <string>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace surge {

// Fastest wave we'll simulate, in meters per second.
inline constexpr double kMaxWaveSpeed = 300.0;

// Direction a wave travels in.  An eastward wave starts at the west edge of the
// area and vice versa.
enum class Direction { kEast, kWest };

absl::string_view DirectionName(Direction direction);

// Flag support, accepts "east" and "west".
bool AbslParseFlag(absl::string_view text, Direction* direction, std::string* error);
std::string AbslUnparseFlag(Direction direction);

// The kinds of wave that can be configured, for choosing one by name.
enum class WaveKind { kLinear, kDeep, kLinearSplit };

// Flag support, accepts "linear", "deep" and "split" (or "linear_split").
bool AbslParseFlag(absl::string_view text, WaveKind* kind, std::string* error);
std::string AbslUnparseFlag(WaveKind kind);

// A front that travels at a constant ground speed at every latitude, so it
// bends to follow the convergence of the meridians.
struct LinearWave {
  double speed = 0;
  Direction direction = Direction::kEast;
};

// A straight north-south front.  It moves at a constant angular rate, chosen
// so that it has the nominal speed at the widest part of the area.
struct DeepWave {
  double speed = 0;
  Direction direction = Direction::kEast;
};

// The area is cut into `nb_splits` equal slices of longitude, each swept by its
// own linear front.  All fronts start together.
struct LinearSplitWave {
  double speed = 0;
  Direction direction = Direction::kEast;
  int nb_splits = 2;
};

using WaveDefinition = std::variant<LinearWave, DeepWave, LinearSplitWave>;

// A wave definition as it comes from configuration: exactly one of the kinds
// must be present.
struct WaveConfig {
  std::optional<LinearWave> linear;
  std::optional<DeepWave> deep;
  std::optional<LinearSplitWave> linear_split;
};

// Returns a human readable message for every problem with the configuration,
// or nothing if it's valid.
std::vector<std::string> ValidateWaveConfig(const WaveConfig& config);

// Returns the single wave kind of a valid configuration, or an
// InvalidArgument error listing every validation failure.
absl::StatusOr<WaveDefinition> MakeWaveDefinition(const WaveConfig& config);

// Accessors shared by every kind.
double WaveSpeed(const WaveDefinition& definition);
Direction WaveDirection(const WaveDefinition& definition);
absl::string_view WaveKindName(const WaveDefinition& definition);

// Number of independently moving fronts.
int FrontCount(const WaveDefinition& definition);

}  // namespace surge
