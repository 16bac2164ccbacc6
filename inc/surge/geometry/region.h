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

#include <algorithm>
#include <cmath>

#include "s2/util/math/vector.h"

namespace surge {

// Planar coordinates in degrees, x is longitude and y is latitude.
using vec2 = Vector2<double>;
using pnt2 = Vector2<double>;

// A closed range of values [v0, v1].  The interval algebra here is used for
// longitude and latitude ranges, so the endpoints are inclusive.
template <typename T>
struct _Interval {
  using type = T;

  _Interval() = default;
  _Interval(T v0, T v1)
    : v0_(v0), v1_(v1) {}

  T   length() const { return v1_-v0_; }
  bool empty() const { return !(length() > 0); }

  T v0() const { return v0_; }
  T v1() const { return v1_; }

  T center() const { return (v0_ + v1_)/2; }

  // Clamps a value to the interval.
  T clamp(T v) const {
    return std::max(v0_, std::min(v1_, v));
  }

  // Arithmetic operators are applied element-wise to each endpoint.
  _Interval& operator +=(T v) { v0_ += v; v1_ += v;            return *this; }
  _Interval& operator -=(T v) { v0_ -= v; v1_ -= v;            return *this; }

  friend _Interval operator+(_Interval i, T v) { return i += v; }
  friend _Interval operator-(_Interval i, T v) { return i -= v; }

  // Returns true if the interval contains a value, endpoints included.
  bool contains(T v) const {
    return v0_ <= v && v <= v1_;
  }

  // Returns true if an interval is contained.
  bool contains(_Interval b) const {
    return contains(b.v0_) && contains(b.v1_);
  }

  // Maps a value in this interval to [0,1].  A zero length interval maps
  // everything to zero.
  T fraction(T v) const {
    if (!(length() > 0)) {
      return 0;
    }
    return (v - v0_)/length();
  }

  // Linearly interpolate between the endpoints, f=0 gives v0 and f=1 gives v1.
  T lerp(T f) const {
    return v0_ + f*length();
  }

  // Shrinks an interval by a given amount on each end.  If the interval would
  // become inverted, returns an empty interval at the midpoint.
  friend _Interval erode(_Interval a, T d) {
    _Interval ans = {a.v0_ + d, a.v1_ - d};
    if (ans.v0_ >= ans.v1_) {
      T middle = (ans.v0_ + ans.v1_)/2;
      return _Interval(middle, middle);
    }
    return ans;
  }

  // Returns the relative change in length going from a to b.  Zero length
  // intervals report an infinite change unless both are zero.
  friend T relative_change(_Interval a, _Interval b) {
    if (a.length() == b.length()) {
      return 0;
    }
    if (!(a.length() > 0)) {
      return INFINITY;
    }
    return std::abs(b.length() - a.length())/a.length();
  }

  bool operator !=(_Interval b) const { return !operator==(b); }
  bool operator ==(_Interval b) const { return v0_ == b.v0_ && v1_ == b.v1_; }

private:
  T v0_ = 0;
  T v1_ = 0;
};

using interval = _Interval<double>;

// A 2D axis-aligned region made of an x and y interval.
template <class T>
struct _Region2 {
  using interval = _Interval<T>;
  using vector   = Vector2<T>;

  _Region2() = default;

  _Region2(interval x, interval y)
    : intervals_{x, y} {}

  // Creates a region from two points specifying opposite corners.
  _Region2(vector p0, vector p1)
    : intervals_{
        interval(std::min(p0[0], p1[0]), std::max(p0[0], p1[0])),
        interval(std::min(p0[1], p1[1]), std::max(p0[1], p1[1]))} {}

  vector center() const {
    return vector(xinterval().center(), yinterval().center());
  }

  const interval& operator[](int idx) const { return intervals_[idx]; }
        interval& operator[](int idx)       { return intervals_[idx]; }

  const interval& xinterval() const { return intervals_[0]; }
        interval& xinterval()       { return intervals_[0]; }

  const interval& yinterval() const { return intervals_[1]; }
        interval& yinterval()       { return intervals_[1]; }

  T  width() const { return xinterval().length(); }
  T height() const { return yinterval().length(); }

  bool empty() const { return xinterval().empty() || yinterval().empty(); }

  // Returns true if the region contains the given point, boundary included.
  bool contains(const vector& pnt) const {
    return xinterval().contains(pnt[0]) && yinterval().contains(pnt[1]);
  }

  bool contains(const _Region2& b) const {
    return xinterval().contains(b.xinterval()) &&
           yinterval().contains(b.yinterval());
  }

  // Clamps each coordinate of a point independently into the region.
  vector clamp(const vector& pnt) const {
    return vector(xinterval().clamp(pnt[0]), yinterval().clamp(pnt[1]));
  }

  bool operator!=(const _Region2& b) const { return !(*this == b); }
  bool operator==(const _Region2& b) const {
    return intervals_[0] == b.intervals_[0] && intervals_[1] == b.intervals_[1];
  }

  // Returns a region shrunk by a given amount along each axis.
  friend _Region2 erode(const _Region2& a, vector d) {
    return _Region2(erode(a[0], d[0]), erode(a[1], d[1]));
  }

private:
  interval intervals_[2];
};

using region2 = _Region2<double>;

}  // namespace surge
