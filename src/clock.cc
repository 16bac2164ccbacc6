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

#include "surge/wave/clock.h"

#include "absl/base/no_destructor.h"
#include "absl/log/check.h"

namespace surge {

const Clock* absl_nonnull SystemClock::Get() {
  static const absl::NoDestructor<SystemClock> clock;
  return clock.get();
}

SimulatedClock::SimulatedClock(absl::Time start, double speed,
  const Clock* absl_nonnull base)
  : base_(base), sim_origin_(start), base_origin_(base->Now()), speed_(speed) {
  CHECK_GT(speed, 0) << "simulation speed must be positive";
}

absl::Time SimulatedClock::Now() const {
  const absl::Time now = base_->Now();
  absl::ReaderMutexLock lock(&lock_);
  return sim_origin_ + (now - base_origin_)*speed_;
}

void SimulatedClock::SetSpeed(double speed) {
  CHECK_GT(speed, 0) << "simulation speed must be positive";

  const absl::Time now = base_->Now();
  absl::WriterMutexLock lock(&lock_);
  sim_origin_ += (now - base_origin_)*speed_;
  base_origin_ = now;
  speed_ = speed;
}

double SimulatedClock::speed() const {
  absl::ReaderMutexLock lock(&lock_);
  return speed_;
}

}  // namespace surge
