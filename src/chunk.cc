#include "chunk.hh"

#include <algorithm>
#include <cassert>
#include <limits>

namespace chunkview {

std::vector<ChunkView> calculate_chunk_views(LineNo first, uint64_t count,
                                             uint32_t chunk_size) {
  assert(chunk_size != 0);
  std::vector<ChunkView> ret;

  uint64_t start_id = first / chunk_size;
  uint64_t end_id = (first + count + chunk_size - 1) / chunk_size;
  assert(end_id < std::numeric_limits<ChunkID>::max());
  ret.reserve(end_id - start_id);
  for (auto id = start_id; id < end_id; id++) {
    auto chunk_off = static_cast<uint32_t>(first % chunk_size);
    auto chunk_len = static_cast<uint32_t>(
        std::min<uint64_t>(chunk_size - chunk_off, count));
    first += chunk_len;
    count -= chunk_len;
    ret.push_back(ChunkView{
        .id_ = static_cast<ChunkID>(id),
        .offset_ = chunk_off,
        .length_ = chunk_len,
    });
  }

  return ret;
}

}  // namespace chunkview
