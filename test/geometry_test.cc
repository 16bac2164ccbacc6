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
#include <cmath>
#include <vector>

#include "absl/status/status.h"
#include "fuzztest/fuzztest.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "surge/geometry/bounding_box.h"
#include "surge/geometry/cut.h"
#include "surge/geometry/polygon.h"
#include "surge/geometry/position.h"
#include "surge/geometry/region.h"

namespace surge {
namespace {

using ::fuzztest::InRange;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;

// One degree of arc on the equator.
constexpr double kMetersPerDegree = kEarthRadiusMeters*M_PI/180;

Polygon Square() {
  return Polygon::FromPositions({{0, 0}, {0, 10}, {10, 10}, {10, 0}});
}

TEST(IntervalTest, ClampAndContainsIncludeEndpoints) {
  const interval i(0, 10);
  EXPECT_EQ(i.clamp(11), 10);
  EXPECT_EQ(i.clamp(-2), 0);
  EXPECT_TRUE(i.contains(0.0));
  EXPECT_TRUE(i.contains(10.0));
  EXPECT_FALSE(i.contains(10.5));
}

TEST(IntervalTest, ErodeCollapsesToMidpoint) {
  EXPECT_EQ(erode(interval(0, 10), 2), interval(2, 8));
  EXPECT_EQ(erode(interval(0, 10), 7), interval(5, 5));
}

TEST(IntervalTest, RelativeChange) {
  EXPECT_DOUBLE_EQ(relative_change(interval(0, 10), interval(5, 16)), 0.1);
  EXPECT_DOUBLE_EQ(relative_change(interval(0, 10), interval(0, 10)), 0);
  EXPECT_TRUE(std::isinf(relative_change(interval(0, 0), interval(0, 1))));
}

TEST(RegionTest, ClampsAxesIndependently) {
  const region2 r(pnt2(0, 0), pnt2(10, 5));
  EXPECT_EQ(r.clamp(pnt2(12, 7)), pnt2(10, 5));
  EXPECT_EQ(r.clamp(pnt2(3, -1)), pnt2(3, 0));
  EXPECT_EQ(r.clamp(pnt2(3, 4)), pnt2(3, 4));
}

TEST(PositionTest, GeodesicDistanceOnEquator) {
  EXPECT_NEAR(GeodesicDistance({0, 0}, {0, 1}), kMetersPerDegree, 1e-3);
  EXPECT_NEAR(GeodesicDistance({0, 0}, {1, 0}), kMetersPerDegree, 1e-3);
  EXPECT_EQ(GeodesicDistance({12, 34}, {12, 34}), 0);
}

TEST(PositionTest, ParallelDistanceFollowsLatitude) {
  EXPECT_NEAR(ParallelDistance(0, 10, 0), 10*kMetersPerDegree, 1e-2);
  EXPECT_NEAR(ParallelDistance(0, 1, 60), kMetersPerDegree/2, 1);
  EXPECT_NEAR(ParallelDistance(10, 0, 0), -10*kMetersPerDegree, 1e-2);
  EXPECT_EQ(ParallelDistance(3, 3, 45), 0);
}

TEST(PositionTest, ParallelDistanceVanishesAtPoles) {
  EXPECT_NEAR(ParallelDistance(0, 90, 90), 0, 1e-6);
  EXPECT_NEAR(ParallelDistance(0, 90, -90), 0, 1e-6);
}

void ParallelDistanceIsFinite(double lng0, double lng1, double lat) {
  const double d = ParallelDistance(lng0, lng1, lat);
  EXPECT_TRUE(std::isfinite(d));
  EXPECT_LE(std::abs(d), std::abs(lng1 - lng0)*kMetersPerDegree + 1e-3);
}
FUZZ_TEST(PositionFuzzing, ParallelDistanceIsFinite)
  .WithDomains(InRange(-360.0, 360.0), InRange(-360.0, 360.0), InRange(-90.0, 90.0));

TEST(PositionTest, NormalizeLongitude) {
  EXPECT_DOUBLE_EQ(NormalizeLongitude(190), -170);
  EXPECT_DOUBLE_EQ(NormalizeLongitude(-190), 170);
  EXPECT_DOUBLE_EQ(NormalizeLongitude(180), -180);
  EXPECT_DOUBLE_EQ(NormalizeLongitude(45), 45);
}

TEST(PositionTest, Validity) {
  EXPECT_TRUE(Position(90, 400).IsValid());
  EXPECT_FALSE(Position(91, 0).IsValid());
  EXPECT_FALSE(Position(NAN, 0).IsValid());
}

TEST(BoundingBoxTest, Dimensions) {
  const BoundingBox box = BoundingBox::FromEdges(10, 20, 15, 30);
  EXPECT_DOUBLE_EQ(box.width(), 10);
  EXPECT_DOUBLE_EQ(box.height(), 5);
  EXPECT_EQ(box.center(), Position(12.5, 25));
  EXPECT_FALSE(box.IsEmpty());
  EXPECT_FALSE(box.Wraps());
}

TEST(BoundingBoxTest, LatitudeOfWidestPart) {
  // Straddling the equator the widest parallel is the equator itself.
  EXPECT_EQ(BoundingBox::FromEdges(-5, 0, 5, 10).LatitudeOfWidestPart(), 0);
  EXPECT_EQ(BoundingBox::FromEdges(10, 0, 15, 10).LatitudeOfWidestPart(), 10);
  EXPECT_EQ(BoundingBox::FromEdges(-30, 0, -10, 10).LatitudeOfWidestPart(), -10);
}

TEST(BoundingBoxTest, WrapsAntimeridian) {
  const BoundingBox box = BoundingBox::FromEdges(-10, 170, 10, -170);
  EXPECT_TRUE(box.Wraps());
  EXPECT_DOUBLE_EQ(box.width(), 20);
  EXPECT_DOUBLE_EQ(box.UnwrappedEast(), 190);
  EXPECT_DOUBLE_EQ(box.center().lng, 180);

  EXPECT_TRUE(box.Contains({0, -175}));
  EXPECT_TRUE(box.Contains({0, 175}));
  EXPECT_FALSE(box.Contains({0, 0}));
  EXPECT_FALSE(box.Contains({11, 175}));

  EXPECT_DOUBLE_EQ(box.UnwrapLongitude(-175), 185);
  EXPECT_DOUBLE_EQ(box.UnwrapLongitude(175), 175);
}

TEST(BoundingBoxTest, RegionRoundTripKeepsWrap) {
  const BoundingBox box = BoundingBox::FromEdges(-10, 170, 10, -170);
  EXPECT_EQ(BoundingBox::FromRegion(box.ToRegion()), box);
}

TEST(BoundingBoxTest, EmptyBoxes) {
  EXPECT_TRUE(BoundingBox().IsEmpty());
  EXPECT_TRUE(BoundingBox::FromEdges(0, 5, 10, 5).IsEmpty());
  EXPECT_TRUE(BoundingBox::FromPositions({}).IsEmpty());
  EXPECT_TRUE(BoundingBox::FromPolygons({}).IsEmpty());
}

TEST(BoundingBoxTest, FromPolygonsCoversEveryVertex) {
  const std::vector<Polygon> polygons = {
    Polygon::FromPositions({{-5, 10}, {-5, 12}, {0, 12}}),
    Polygon::FromPositions({{3, -4}, {8, -4}, {8, 1}})};
  EXPECT_EQ(BoundingBox::FromPolygons(polygons),
    BoundingBox::FromEdges(-5, -4, 8, 12));
}

TEST(PolygonTest, FromPositionsDropsClosingVertex) {
  const Polygon closed = Polygon::FromPositions({{0, 0}, {0, 1}, {1, 1}, {0, 0}});
  EXPECT_THAT(closed.vertices(), SizeIs(3));
  EXPECT_THAT(closed.Positions(true), SizeIs(4));
}

TEST(PolygonTest, AreaAndWinding) {
  const Polygon square = Square();
  EXPECT_DOUBLE_EQ(square.SignedArea(), 100);
  EXPECT_FALSE(square.IsClockwise());

  const Polygon reversed = Polygon::FromPositions({{10, 0}, {10, 10}, {0, 10}, {0, 0}});
  EXPECT_DOUBLE_EQ(reversed.SignedArea(), -100);
  EXPECT_TRUE(reversed.IsClockwise());
}

TEST(PolygonTest, Degenerate) {
  EXPECT_TRUE(Polygon::FromPositions({{0, 0}, {1, 1}}).IsDegenerate());
  EXPECT_TRUE(Polygon::FromPositions({{0, 0}, {1, 1}, {2, 2}}).IsDegenerate());
  EXPECT_FALSE(Square().IsDegenerate());
}

TEST(PolygonTest, ContainsUsesRayCasting) {
  const Polygon square = Square();
  EXPECT_TRUE(square.Contains({5, 5}));
  EXPECT_FALSE(square.Contains({15, 5}));
  EXPECT_FALSE(square.Contains({5, -1}));

  // Vertices themselves count as inside.
  EXPECT_TRUE(square.Contains({0, 0}));

  // Concave L shape, the notch is outside.
  const Polygon ell = Polygon::FromPositions(
    {{0, 0}, {0, 10}, {5, 10}, {5, 5}, {10, 5}, {10, 0}});
  EXPECT_TRUE(ell.Contains({2, 8}));
  EXPECT_FALSE(ell.Contains({8, 8}));
}

TEST(PolygonTest, CentroidAndBounds) {
  const Polygon square = Square();
  EXPECT_TRUE(square.Centroid().ApproxEquals({5, 5}));
  EXPECT_EQ(square.Bounds(), BoundingBox::FromEdges(0, 0, 10, 10));
}

TEST(PolygonTest, ParsePolygon) {
  absl::StatusOr<Polygon> polygon = ParsePolygon("0:0, 0:10, 10:10, 0:0");
  ASSERT_TRUE(polygon.ok()) << polygon.status();
  EXPECT_THAT(polygon->Positions(),
    ElementsAre(Position(0, 0), Position(0, 10), Position(10, 10)));

  EXPECT_EQ(ParsePolygon("0:0, nope").status().code(),
    absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(ParsePolygon("0:0, 0:1").status().message(),
    HasSubstr("at least 3"));
  EXPECT_THAT(ParsePosition("95:0").status().message(), HasSubstr("range"));
}

TEST(CutTest, StraightCut) {
  const Cut cut = Cut::Straight(5);
  EXPECT_TRUE(cut.IsStraight());
  EXPECT_EQ(cut.LongitudeAt(-80), 5);
  EXPECT_EQ(cut.LongitudeAt(45), 5);

  EXPECT_EQ(cut.SideOf(Position(0, 4)), Cut::Side::kWest);
  EXPECT_EQ(cut.SideOf(Position(0, 6)), Cut::Side::kEast);
  EXPECT_EQ(cut.SideOf(Position(0, 5)), Cut::Side::kOn);
  EXPECT_EQ(cut.SideOf(Position(0, 5 + 1e-12)), Cut::Side::kOn);
  EXPECT_TRUE(cut.BreakpointsBetween(-10, 10).empty());
}

TEST(CutTest, ComposedCutIsPiecewiseLinear) {
  const Cut cut = Cut::Composed({{10, 10}, {0, 0}});
  EXPECT_FALSE(cut.IsStraight());
  EXPECT_DOUBLE_EQ(cut.LongitudeAt(5), 5);

  // Extended with constant longitude past either end.
  EXPECT_DOUBLE_EQ(cut.LongitudeAt(-5), 0);
  EXPECT_DOUBLE_EQ(cut.LongitudeAt(20), 10);
  EXPECT_EQ(cut.LongitudeRange(), interval(0, 10));
}

TEST(CutTest, BreakpointsBetweenAreStrictAndOrdered) {
  const Cut cut = Cut::Composed({{0, 0}, {5, 2}, {7, 1}, {10, 0}});
  EXPECT_THAT(cut.BreakpointsBetween(0, 10),
    ElementsAre(Position(5, 2), Position(7, 1)));
  EXPECT_THAT(cut.BreakpointsBetween(10, 0),
    ElementsAre(Position(7, 1), Position(5, 2)));
  EXPECT_THAT(cut.BreakpointsBetween(0, 5), SizeIs(0));
}

TEST(CutTest, IdentityIsSharedByCopies) {
  const Cut a = Cut::Straight(1);
  const Cut b = a;
  const Cut c = Cut::Straight(1);
  EXPECT_EQ(a.id(), b.id());
  EXPECT_NE(a.id(), c.id());
}

TEST(CutTest, TaggedVerticesAreOnTheirCut) {
  const Cut cut = Cut::Straight(5);
  const Cut other = Cut::Straight(5);

  // Far from the line, but produced by this cut.
  const Vertex tagged(Position(0, 7), CutTag{cut.id(), {}, {}});
  EXPECT_EQ(cut.SideOf(tagged), Cut::Side::kOn);
  EXPECT_EQ(other.SideOf(tagged), Cut::Side::kEast);
}

TEST(CutTest, ValidateArc) {
  const Cut arc = Cut::Composed({{0, 0}, {1, 1}, {2, 1.5}, {3, 1.5}, {4, 1}});
  EXPECT_TRUE(arc.ValidateArc().ok());

  const Cut zigzag = Cut::Composed(
    {{0, 0}, {1, 1}, {2, 0}, {3, 1}, {4, 0}, {5, 1}, {6, 0}});
  EXPECT_EQ(zigzag.ValidateArc().code(), absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace surge
