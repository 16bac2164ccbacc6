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

#include "surge/wave/wave_definition.h"

#include <cmath>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

namespace surge {

namespace {

// Overload set for std::visit.
template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void ValidateSpeed(absl::string_view kind, double speed,
  std::vector<std::string>* errors) {
  if (!std::isfinite(speed) || speed <= 0 || speed > kMaxWaveSpeed) {
    errors->push_back(absl::StrFormat(
      "%s: speed must be greater than 0 and at most %g m/s, got %g",
      kind, kMaxWaveSpeed, speed));
  }
}

}  // namespace

absl::string_view DirectionName(Direction direction) {
  switch (direction) {
    case Direction::kEast: return "east";
    case Direction::kWest: return "west";
  }
  return "unknown";
}

bool AbslParseFlag(absl::string_view text, Direction* direction, std::string* error) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "east") {
    *direction = Direction::kEast;
    return true;
  }
  if (lower == "west") {
    *direction = Direction::kWest;
    return true;
  }
  *error = absl::StrFormat("unknown direction '%s', expected east or west", text);
  return false;
}

std::string AbslUnparseFlag(Direction direction) {
  return std::string(DirectionName(direction));
}

bool AbslParseFlag(absl::string_view text, WaveKind* kind, std::string* error) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "linear") {
    *kind = WaveKind::kLinear;
    return true;
  }
  if (lower == "deep") {
    *kind = WaveKind::kDeep;
    return true;
  }
  if (lower == "split" || lower == "linear_split") {
    *kind = WaveKind::kLinearSplit;
    return true;
  }
  *error = absl::StrFormat(
    "unknown wave kind '%s', expected linear, deep or split", text);
  return false;
}

std::string AbslUnparseFlag(WaveKind kind) {
  switch (kind) {
    case WaveKind::kLinear:      return "linear";
    case WaveKind::kDeep:        return "deep";
    case WaveKind::kLinearSplit: return "split";
  }
  return "unknown";
}

std::vector<std::string> ValidateWaveConfig(const WaveConfig& config) {
  std::vector<std::string> errors;

  const int kinds = config.linear.has_value() + config.deep.has_value() +
                    config.linear_split.has_value();
  if (kinds == 0) {
    errors.push_back("wave definition has no kind, one of linear, deep or "
                     "linear_split is required");
  } else if (kinds > 1) {
    errors.push_back(absl::StrFormat(
      "wave definition has %d kinds, only one of linear, deep or "
      "linear_split is allowed", kinds));
  }

  if (config.linear) {
    ValidateSpeed("linear", config.linear->speed, &errors);
  }
  if (config.deep) {
    ValidateSpeed("deep", config.deep->speed, &errors);
  }
  if (config.linear_split) {
    ValidateSpeed("linear_split", config.linear_split->speed, &errors);
    if (config.linear_split->nb_splits < 2) {
      errors.push_back(absl::StrFormat(
        "linear_split: nb_splits must be at least 2, got %d",
        config.linear_split->nb_splits));
    }
  }
  return errors;
}

absl::StatusOr<WaveDefinition> MakeWaveDefinition(const WaveConfig& config) {
  std::vector<std::string> errors = ValidateWaveConfig(config);
  if (!errors.empty()) {
    return absl::InvalidArgumentError(absl::StrJoin(errors, "; "));
  }

  if (config.linear) return WaveDefinition(*config.linear);
  if (config.deep)   return WaveDefinition(*config.deep);
  return WaveDefinition(*config.linear_split);
}

double WaveSpeed(const WaveDefinition& definition) {
  return std::visit([](const auto& wave) { return wave.speed; }, definition);
}

Direction WaveDirection(const WaveDefinition& definition) {
  return std::visit([](const auto& wave) { return wave.direction; }, definition);
}

absl::string_view WaveKindName(const WaveDefinition& definition) {
  return std::visit(Overloaded{
    [](const LinearWave&) -> absl::string_view { return "linear"; },
    [](const DeepWave&) -> absl::string_view { return "deep"; },
    [](const LinearSplitWave&) -> absl::string_view { return "linear_split"; },
  }, definition);
}

int FrontCount(const WaveDefinition& definition) {
  return std::visit(Overloaded{
    [](const LinearSplitWave& wave) { return wave.nb_splits; },
    [](const auto&) { return 1; },
  }, definition);
}

}  // namespace surge
