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

#include "surge/geometry/polygon_splitter.h"

#include <algorithm>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "absl/log/log.h"

#include "surge/geometry/chain_stitcher.h"

namespace surge {

namespace {

using Side = Cut::Side;

// A vertex of the ring after crossings have been inserted, with its side.
struct Node {
  Vertex vertex;
  Side side;
};

// One end of a chain of vertices lying on a single side of the cut.
struct ChainEnd {
  double lat;
  int chain;
  bool exit;
};

// A run of consecutive ring edges on one side of the cut, as an offset into
// the ring and a number of edges.
struct Chain {
  size_t beg;
  size_t len;
};

bool IsStrict(Side side) {
  return side != Side::kOn;
}

// Returns the ring with repeated consecutive positions removed, including a
// repeat of the first vertex at the end.
std::vector<Vertex> CleanRing(absl::Span<const Vertex> vertices) {
  std::vector<Vertex> ring;
  ring.reserve(vertices.size());
  for (const Vertex& v : vertices) {
    if (ring.empty() || ring.back().pos != v.pos) {
      ring.emplace_back(v);
    }
  }
  while (ring.size() > 1 && ring.back().pos == ring.front().pos) {
    ring.pop_back();
  }
  return ring;
}

// Returns the position on the cut at parameter t along the edge p->q.
Position PointOnCut(const Cut& cut, const Position& p, const Position& q, double t) {
  const double lat = p.lat + t*(q.lat - p.lat);
  return Position(lat, cut.LongitudeAt(lat));
}

// Appends a node for every point where the edge from a to b crosses the cut,
// ordered from a to b.
void AppendCrossings(const Cut& cut, const Node& a, const Node& b,
  std::vector<Node>* out) {

  // A straight edge can only cross a meridian between opposite endpoints.
  if (cut.IsStraight() &&
      !(IsStrict(a.side) && IsStrict(b.side) && a.side != b.side)) {
    return;
  }

  // Always interpolate from the lesser endpoint so that the same edge walked
  // in either direction gives the same result.
  const bool forward = a.vertex.pos < b.vertex.pos;
  const Position& p = forward ? a.vertex.pos : b.vertex.pos;
  const Position& q = forward ? b.vertex.pos : a.vertex.pos;

  // Sample the signed longitude offset from the cut at the endpoints and at
  // every latitude the cut bends at.  Between samples it's linear.
  struct Sample {
    double t;
    double offset;
    Side side;
  };

  absl::InlinedVector<Sample, 4> samples;
  samples.push_back({0, p.lng - cut.LongitudeAt(p.lat), forward ? a.side : b.side});
  for (const Position& bend : cut.BreakpointsBetween(p.lat, q.lat)) {
    const double t = (bend.lat - p.lat)/(q.lat - p.lat);
    const Position at(bend.lat, p.lng + t*(q.lng - p.lng));
    samples.push_back({t, at.lng - bend.lng, cut.SideOf(at)});
  }
  samples.push_back({1, q.lng - cut.LongitudeAt(q.lat), forward ? b.side : a.side});

  absl::InlinedVector<Position, 2> crossings;
  for (size_t k = 0; k + 1 < samples.size(); ++k) {
    const Sample& s0 = samples[k+0];
    const Sample& s1 = samples[k+1];

    // An interior sample sitting on the cut between opposite sides.
    if (k > 0 && s0.side == Side::kOn) {
      const Side before = samples[k-1].side;
      if (IsStrict(before) && IsStrict(s1.side) && before != s1.side) {
        crossings.push_back(PointOnCut(cut, p, q, s0.t));
      }
    }

    if (IsStrict(s0.side) && IsStrict(s1.side) && s0.side != s1.side) {
      const double t = s0.t + (s1.t - s0.t)*(s0.offset/(s0.offset - s1.offset));
      crossings.push_back(PointOnCut(cut, p, q, t));
    }
  }

  if (!forward) {
    std::reverse(crossings.begin(), crossings.end());
  }

  for (const Position& crossing : crossings) {
    out->push_back({Vertex(crossing, CutTag{cut.id(), p, q}), Side::kOn});
  }
}

// Returns the side that the edge between two adjacent nodes lies on.
Side EdgeSide(const Cut& cut, const Node& a, const Node& b) {
  if (IsStrict(a.side)) {
    return a.side;
  }
  if (IsStrict(b.side)) {
    return b.side;
  }

  // Both ends are on the cut, the edge either runs along it or bulges off to
  // one side around a bend.
  const Position& pa = a.vertex.pos;
  const Position& pb = b.vertex.pos;
  return cut.SideOf(Position((pa.lat + pb.lat)/2, (pa.lng + pb.lng)/2));
}

// Builds the pieces of the ring on one side of the cut and appends them to
// `out`.  Returns false if the chains on this side can't be paired up
// consistently along the cut.
bool StitchSide(const Cut& cut, absl::Span<const Node> nodes,
  absl::Span<const Side> edges, Side side, std::vector<Polygon>* out) {
  const size_t m = nodes.size();

  auto usable = [&](size_t offset) {
    return edges[offset % m] == side || edges[offset % m] == Side::kOn;
  };

  // Start from an edge on the other side so that no chain wraps past the end.
  size_t start = 0;
  while (start < m && usable(start)) {
    ++start;
  }
  if (start == m) {
    return false;
  }

  // Find maximal runs of edges on this side.  Edges running along the cut at
  // either end of a run are trimmed off, the stitching below replaces them.
  std::vector<Chain> chains;
  for (size_t o = 1; o < m;) {
    if (!usable(start + o)) {
      ++o;
      continue;
    }

    size_t beg = o;
    while (o < m && usable(start + o)) {
      ++o;
    }
    size_t end = o;

    while (beg < end && edges[(start + beg) % m] == Side::kOn) ++beg;
    while (end > beg && edges[(start + end - 1) % m] == Side::kOn) --end;
    if (beg < end) {
      chains.push_back({start + beg, end - beg});
    }
  }

  // Load chains into the stitcher and note where they enter and exit the cut.
  ChainStitcher stitcher;
  std::vector<int> heads, tails;
  std::vector<ChainEnd> ends;
  for (size_t c = 0; c < chains.size(); ++c) {
    const Node& entry = nodes[(chains[c].beg) % m];
    const Node& exit  = nodes[(chains[c].beg + chains[c].len) % m];
    if (IsStrict(entry.side) || IsStrict(exit.side)) {
      return false;
    }

    stitcher.Break();
    heads.push_back(stitcher.NextVertex());
    for (size_t j = 0; j <= chains[c].len; ++j) {
      stitcher.Append(nodes[(chains[c].beg + j) % m].vertex);
    }
    tails.push_back(stitcher.LastVertex());

    ends.push_back({entry.vertex.pos.lat, static_cast<int>(c), false});
    ends.push_back({exit.vertex.pos.lat,  static_cast<int>(c), true});
  }
  stitcher.Break();

  // Along the cut the ends alternate between the start and end of a stretch
  // inside the polygon, so adjacent pairs connect an exit to an entry.
  std::stable_sort(ends.begin(), ends.end(),
    [](const ChainEnd& a, const ChainEnd& b) { return a.lat < b.lat; });

  for (size_t k = 0; k + 1 < ends.size(); k += 2) {
    if (ends[k].exit == ends[k+1].exit) {
      return false;
    }
    const ChainEnd& exit  = ends[k].exit ? ends[k] : ends[k+1];
    const ChainEnd& entry = ends[k].exit ? ends[k+1] : ends[k];

    const Position from = stitcher[tails[exit.chain]].pos;
    const Position to   = stitcher[heads[entry.chain]].pos;

    // Follow the cut between the two points, picking up any bends.
    std::vector<Position> bends = cut.BreakpointsBetween(from.lat, to.lat);
    if (bends.empty()) {
      stitcher.Connect(tails[exit.chain], heads[entry.chain]);
      continue;
    }

    const int first = stitcher.NextVertex();
    for (const Position& bend : bends) {
      stitcher.Append(Vertex(bend, CutTag{cut.id(), from, to}));
    }
    stitcher.Break();
    stitcher.Connect(tails[exit.chain], first);
    stitcher.Connect(stitcher.LastVertex(), heads[entry.chain]);
  }

  return stitcher.EmitChains([&](absl::Span<const Vertex> ring) {
    Polygon piece(CleanRing(ring));
    if (!piece.IsDegenerate()) {
      out->push_back(std::move(piece));
    }
  });
}

}  // namespace

SplitResult Split(const Polygon& polygon, const Cut& cut) {
  SplitResult result;

  const std::vector<Vertex> ring = CleanRing(polygon.vertices());
  if (ring.size() < 3) {
    return result;
  }

  const size_t n = ring.size();
  std::vector<Node> original;
  original.reserve(n);
  for (const Vertex& v : ring) {
    original.push_back({v, cut.SideOf(v)});
  }

  std::vector<Node> nodes;
  nodes.reserve(n + 4);
  for (size_t i = 0; i < n; ++i) {
    nodes.push_back(original[i]);
    AppendCrossings(cut, original[i], original[(i+1) % n], &nodes);
  }

  const size_t m = nodes.size();
  std::vector<Side> edges(m);
  bool west = false;
  bool east = false;
  for (size_t i = 0; i < m; ++i) {
    edges[i] = EdgeSide(cut, nodes[i], nodes[(i+1) % m]);
    west |= (edges[i] == Side::kWest);
    east |= (edges[i] == Side::kEast);
  }

  if (!west && !east) {
    return result;
  }

  if (!east) {
    result.left.push_back(polygon);
    return result;
  }

  if (!west) {
    result.right.push_back(polygon);
    return result;
  }

  if (StitchSide(cut, nodes, edges, Side::kWest, &result.left) &&
      StitchSide(cut, nodes, edges, Side::kEast, &result.right)) {
    return result;
  }

  // Self-intersecting input can leave crossings that don't pair up.  Rather
  // than emit garbage, keep the polygon whole on the side of its centroid.
  const Position centroid = polygon.Centroid();
  LOG(WARNING) << "Unable to stitch polygon of " << polygon.size()
               << " vertices along cut " << cut.id()
               << ", assigning it whole by centroid " << centroid;

  result = SplitResult();
  if (cut.SideOf(centroid) == Side::kEast) {
    result.right.push_back(polygon);
  } else {
    result.left.push_back(polygon);
  }
  return result;
}

SplitResult SplitArea(absl::Span<const Polygon> area, const Cut& cut) {
  SplitResult result;
  for (const Polygon& polygon : area) {
    if (polygon.IsDegenerate()) {
      continue;
    }

    SplitResult pieces = Split(polygon, cut);
    for (Polygon& piece : pieces.left) {
      result.left.push_back(std::move(piece));
    }
    for (Polygon& piece : pieces.right) {
      result.right.push_back(std::move(piece));
    }
  }
  return result;
}

}  // namespace surge
