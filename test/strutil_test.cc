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
#include "absl/time/time.h"
#include "gtest/gtest.h"

#include "surge/strutil.h"

namespace surge {
namespace {

TEST(EngnotTest, PicksPrefix) {
  EXPECT_EQ(engnot(12500, "m"), "12.5 km");
  EXPECT_EQ(engnot(-2.5e6, "m"), "-2.5 Mm");
  EXPECT_EQ(engnot(42, "m"), "42.0 m");
  EXPECT_EQ(engnot(0, "m"), "0.0 m");
  EXPECT_EQ(engnot(0.25, "s"), "250.0 ms");
}

TEST(EngnotTest, BadFormat) {
  EXPECT_EQ(engnot(1, "m", "%d"), "<badfmt>");
}

TEST(ShortDurationTest, TruncatesToSeconds) {
  EXPECT_EQ(ShortDuration(absl::Seconds(61.7)), "1m1s");
  EXPECT_EQ(ShortDuration(absl::Hours(3) + absl::Milliseconds(20)), "3h");
  EXPECT_EQ(ShortDuration(-absl::Seconds(90)), "-1m30s");
}

}  // namespace
}  // namespace surge
