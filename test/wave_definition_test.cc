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
#include <string>
#include <variant>
#include <vector>

#include "absl/flags/marshalling.h"
#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "surge/wave/wave_definition.h"

namespace surge {
namespace {

using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

TEST(WaveConfigTest, SingleLinearKindIsValid) {
  WaveConfig config;
  config.linear = LinearWave{100, Direction::kEast};
  EXPECT_THAT(ValidateWaveConfig(config), IsEmpty());

  absl::StatusOr<WaveDefinition> definition = MakeWaveDefinition(config);
  ASSERT_TRUE(definition.ok()) << definition.status();
  EXPECT_TRUE(std::holds_alternative<LinearWave>(*definition));
  EXPECT_EQ(WaveSpeed(*definition), 100);
  EXPECT_EQ(WaveDirection(*definition), Direction::kEast);
  EXPECT_EQ(WaveKindName(*definition), "linear");
  EXPECT_EQ(FrontCount(*definition), 1);
}

TEST(WaveConfigTest, MissingKind) {
  const std::vector<std::string> errors = ValidateWaveConfig(WaveConfig());
  ASSERT_THAT(errors, SizeIs(1));
  EXPECT_THAT(errors[0], HasSubstr("no kind"));
  EXPECT_EQ(MakeWaveDefinition(WaveConfig()).status().code(),
    absl::StatusCode::kInvalidArgument);
}

TEST(WaveConfigTest, SeveralKinds) {
  WaveConfig config;
  config.linear = LinearWave{10, Direction::kEast};
  config.deep = DeepWave{10, Direction::kWest};
  const std::vector<std::string> errors = ValidateWaveConfig(config);
  ASSERT_THAT(errors, SizeIs(1));
  EXPECT_THAT(errors[0], HasSubstr("2 kinds"));
}

TEST(WaveConfigTest, SpeedOutOfRange) {
  WaveConfig config;
  config.deep = DeepWave{0, Direction::kEast};
  EXPECT_THAT(ValidateWaveConfig(config), SizeIs(1));

  config.deep->speed = -5;
  EXPECT_THAT(ValidateWaveConfig(config), SizeIs(1));

  config.deep->speed = kMaxWaveSpeed + 1;
  EXPECT_THAT(ValidateWaveConfig(config), SizeIs(1));

  config.deep->speed = kMaxWaveSpeed;
  EXPECT_THAT(ValidateWaveConfig(config), IsEmpty());
}

TEST(WaveConfigTest, ErrorsAreAllReported) {
  WaveConfig config;
  config.linear_split = LinearSplitWave{0, Direction::kEast, 1};
  EXPECT_THAT(ValidateWaveConfig(config), SizeIs(2));

  const absl::Status status = MakeWaveDefinition(config).status();
  EXPECT_THAT(status.message(),
    AllOf(HasSubstr("speed"), HasSubstr("nb_splits"), HasSubstr("; ")));
}

TEST(WaveConfigTest, SplitWaveHasOneFrontPerSplit) {
  WaveConfig config;
  config.linear_split = LinearSplitWave{50, Direction::kWest, 4};

  absl::StatusOr<WaveDefinition> definition = MakeWaveDefinition(config);
  ASSERT_TRUE(definition.ok()) << definition.status();
  EXPECT_EQ(WaveKindName(*definition), "linear_split");
  EXPECT_EQ(WaveDirection(*definition), Direction::kWest);
  EXPECT_EQ(FrontCount(*definition), 4);
}

TEST(DirectionTest, FlagRoundTrip) {
  Direction direction = Direction::kEast;
  std::string error;
  EXPECT_TRUE(absl::ParseFlag("West", &direction, &error));
  EXPECT_EQ(direction, Direction::kWest);
  EXPECT_EQ(absl::UnparseFlag(direction), "west");

  EXPECT_FALSE(absl::ParseFlag("north", &direction, &error));
  EXPECT_THAT(error, HasSubstr("north"));
}

TEST(WaveKindTest, FlagAcceptsEveryKind) {
  WaveKind kind = WaveKind::kLinear;
  std::string error;
  EXPECT_TRUE(absl::ParseFlag("deep", &kind, &error));
  EXPECT_EQ(kind, WaveKind::kDeep);
  EXPECT_TRUE(absl::ParseFlag("Linear_Split", &kind, &error));
  EXPECT_EQ(kind, WaveKind::kLinearSplit);
  EXPECT_EQ(absl::UnparseFlag(kind), "split");
  EXPECT_TRUE(absl::ParseFlag(absl::UnparseFlag(kind), &kind, &error));
  EXPECT_EQ(kind, WaveKind::kLinearSplit);
}

TEST(WaveKindTest, FlagRejectsUnknownKindByName) {
  WaveKind kind = WaveKind::kDeep;
  std::string error;
  EXPECT_FALSE(absl::ParseFlag("spiral", &kind, &error));
  EXPECT_THAT(error, HasSubstr("'spiral'"));
  EXPECT_EQ(kind, WaveKind::kDeep);
}

}  // namespace
}  // namespace surge
