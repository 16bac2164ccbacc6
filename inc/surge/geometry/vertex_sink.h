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

#include <sys/types.h>

#include "absl/base/nullability.h"
#include "absl/types/span.h"

#include "surge/geometry/polygon.h"
#include "surge/geometry/position.h"

namespace surge {

// Receives polygon vertices grouped into chains.  A chain is either left open
// with Break() or joined back to its first vertex with Close(), which turns it
// into a ring.
class VertexSink {
 public:
  virtual ~VertexSink() = default;

  // Drops every vertex and chain.
  virtual void Clear() = 0;

  // Leaves the current chain open.  The next vertex starts a new one.
  virtual void Break() = 0;

  // Joins the current chain back to its first vertex.  The next vertex starts
  // a new chain.  No-op without a current chain.
  virtual void Close() = 0;

  // Extends the current chain, starting one if needed.
  virtual void Append(const Vertex&) = 0;
  virtual void Append(absl::Span<const Vertex>) = 0;

  // Vertices held across every chain.
  virtual ssize_t Size() const = 0;

  bool Empty() const { return Size() == 0; }
};

// Adds a polygon to the sink as a new ring.
inline void AppendRing(VertexSink* absl_nonnull out, const Polygon& polygon) {
  out->Break();
  out->Append(absl::MakeConstSpan(polygon.vertices()));
  out->Close();
}

// Adds untagged positions to the sink as a new open chain.
inline void AppendChain(VertexSink* absl_nonnull out,
  absl::Span<const Position> positions) {
  out->Break();
  for (const Position& p : positions) {
    out->Append(Vertex(p));
  }
  out->Break();
}

}  // namespace surge
