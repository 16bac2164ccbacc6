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

#include "absl/base/nullability.h"
#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace surge {

// Source of the current time.  Everything that depends on time takes a Clock
// so that it can be replaced with a simulated or manually driven one.
class Clock {
 public:
  virtual ~Clock() = default;

  virtual absl::Time Now() const = 0;
};

// Wall clock time.
class SystemClock : public Clock {
 public:
  absl::Time Now() const override { return absl::Now(); }

  // A process wide instance.
  static const Clock* absl_nonnull Get();
};

// A clock that starts at a chosen instant and runs at a multiple of the speed
// of an underlying clock.  Used for playback of an event ahead of time.
class SimulatedClock : public Clock {
 public:
  // Starts simulating at `start` running `speed` times faster than `base`.
  // The speed must be positive.
  SimulatedClock(absl::Time start, double speed,
    const Clock* absl_nonnull base = SystemClock::Get());

  absl::Time Now() const override;

  // Changes the speed from now on without making time jump.
  void SetSpeed(double speed);
  double speed() const;

 private:
  const Clock* absl_nonnull base_;

  mutable absl::Mutex lock_;
  absl::Time sim_origin_  ABSL_GUARDED_BY(lock_);
  absl::Time base_origin_ ABSL_GUARDED_BY(lock_);
  double speed_           ABSL_GUARDED_BY(lock_);
};

// A clock that only moves when told to.
class ManualClock : public Clock {
 public:
  explicit ManualClock(absl::Time now = absl::UnixEpoch())
    : now_(now) {}

  absl::Time Now() const override {
    absl::ReaderMutexLock lock(&lock_);
    return now_;
  }

  void SetTime(absl::Time now) {
    absl::WriterMutexLock lock(&lock_);
    now_ = now;
  }

  void Advance(absl::Duration d) {
    absl::WriterMutexLock lock(&lock_);
    now_ += d;
  }

 private:
  mutable absl::Mutex lock_;
  absl::Time now_ ABSL_GUARDED_BY(lock_);
};

}  // namespace surge
