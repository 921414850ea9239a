#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace chunkview {

using ChunkID = uint32_t;
using LineNo = uint64_t;
using Lines = std::vector<std::string>;

// Immutable compressed payload of one chunk. Replaced, never mutated, so a
// holder of the pointer keeps a consistent snapshot.
using CompressedChunk = std::shared_ptr<const std::string>;

// A run of lines inside one chunk: lines [offset_, offset_ + length_) of
// chunk id_.
struct ChunkView {
  ChunkID id_;
  uint32_t offset_;
  uint32_t length_;

  std::strong_ordering operator<=>(const ChunkView&) const = default;
};

inline ChunkID chunk_of(LineNo line, uint32_t chunk_size) {
  return static_cast<ChunkID>(line / chunk_size);
}

// Whether [first, first + count) lies in chunks whose ids, and the id of the
// chunk after the last one, fit in ChunkID. Lines outside never exist.
inline bool addressable(LineNo first, uint64_t count, uint32_t chunk_size) {
  if (count > std::numeric_limits<LineNo>::max() - first) {
    return false;
  }
  auto end = first + count;
  auto end_id = end / chunk_size + (end % chunk_size != 0 ? 1 : 0);
  return end_id < std::numeric_limits<ChunkID>::max();
}

// Splits the line range [first, first + count) at chunk boundaries.
std::vector<ChunkView> calculate_chunk_views(LineNo first, uint64_t count,
                                             uint32_t chunk_size);

}  // namespace chunkview
