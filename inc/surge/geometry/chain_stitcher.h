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

#include <vector>

#include "absl/base/nullability.h"
#include "absl/functional/function_ref.h"
#include "absl/types/span.h"
#include "s2/util/bitmap/bitmap.h"

#include "surge/geometry/polygon.h"
#include "surge/geometry/vertex_sink.h"

namespace surge {

// A helper class to support stitching cut polygon loops back together.
//
// Vertices are appended in chains, then chains are joined end to start with
// Connect() and walked back out as rings with EmitChains().

class ChainStitcher : public VertexSink {
 private:
  static constexpr int kUnconnected = -1;

 public:
  // Clears the stitch buffer for a new shape.
  void Clear() override {
    nodes_.clear();
    nexts_.clear();
    Break();
  }

  // Returns true when the stitcher is waiting to start a new chain.
  bool Broken() const {
    return tail_ == kUnconnected;
  }

  // Breaks the current chain, the next vertex appended will be unconnected.
  void Break() override {
    tail_ = kUnconnected;
  }

  // Close the current chain, the next vertex appended will be unconnected.
  void Close() override {
    if (Broken()) {
      return;
    }

    // If the tail is a repeat of the head, pop the tail before connecting.
    if (tail_ > head_ && nodes_[tail_].pos == nodes_[head_].pos) {
      nodes_.pop_back();
      nexts_.pop_back();
      --tail_;
    }
    Connect(tail_, head_);
    Break();
  }

  // Appends a new vertex to the buffer, connecting it to the previous vertex.
  void Append(const Vertex& vertex) override {
    const int next = nodes_.size();

    if (Broken()) {
      head_ = next;  // Save start of new chain.
    } else {
      Connect(tail_, next);
    }

    nodes_.emplace_back(vertex);
    nexts_.emplace_back(kUnconnected);
    tail_ = next;
  }

  // Appends a span of vertices to the buffer.
  void Append(absl::Span<const Vertex> vertices) override {
    for (const Vertex& vertex : vertices) {
      Append(vertex);
    }
  }

  ssize_t Size() const override {
    return nodes_.size();
  }

  // Returns the index of the last vertex (may be kUnconnected if there is none).
  int LastVertex() const {
    return Size() - 1;
  }

  // Returns the index the next vertex added will have.
  int NextVertex() const {
    return Size();
  }

  // Make vertex B the next vertex after A.  Returns B.
  int Connect(int a, int b) {
    return nexts_[a] = b;
  }

  // Returns true if the vertex has a successor.
  bool Connected(int a) const {
    return nexts_[a] != kUnconnected;
  }

  // Emits each connected chain to the given callback.  Returns false if an
  // infinite loop is detected in the connected vertices, true otherwise.
  bool EmitChains(absl::FunctionRef<void(absl::Span<const Vertex>)> emit) {
    const size_t total_vertices = nodes_.size();
    util::bitmap::Bitmap64 unseen(total_vertices, true);

    size_t start;
    while (unseen.FindFirstSetBit(&start)) {
      scratch_.clear();

      // We'll try to emit vertices in-place from the vertices array.
      bool in_place = true;

      size_t cnt = 0;
      ssize_t cur = start;
      ssize_t beg = cur;
      ssize_t end = beg;

      do {
        if (in_place) {
          if (cur == end) {
            ++end;
          } else {
            // Disjoint vertex, punt and switch to out of place mode.
            in_place = false;
            for (ssize_t ii = beg; ii < end; ++ii) {
              scratch_.emplace_back(nodes_[ii]);
            }
          }
        }

        if (!in_place) {
          scratch_.emplace_back(nodes_[cur]);
        }

        // We should emit each vertex once so if we total up to more than the
        // total number of vertices, then we must have hit an infinite loop.
        if (++cnt > total_vertices) {
          return false;
        }

        unseen.Set(cur, false);
        cur = nexts_[cur];

      } while (cur != kUnconnected && cur != static_cast<ssize_t>(start));

      if (in_place) {
        emit(absl::MakeConstSpan(&nodes_[beg], end - beg));
      } else {
        emit(scratch_);
      }
    }

    return true;
  }

  const Vertex& operator[](int index) const {
    return nodes_[index];
  }

 private:
  int head_ = 0;
  int tail_ = kUnconnected;

  std::vector<Vertex> nodes_;
  std::vector<int>    nexts_;
  std::vector<Vertex> scratch_;
};

}  // namespace surge
