#pragma once

#include "chunk.hh"
#include "codec.hh"
#include "noncopyable.hh"

#include <mutex>
#include <span>

class ChunkStoreTest;

namespace chunkview {

// Ordered sequence of compressed chunks plus the authoritative line count.
// Chunk i holds lines [i * chunk_size, (i + 1) * chunk_size); only the last
// chunk may be partial.
class ChunkStore : NonCopyable {
public:
  struct Staged {
    ChunkID id;
    CompressedChunk data;
  };

  ChunkStore(std::shared_ptr<const Codec> codec, uint32_t chunk_size);

  // Out of range ids read as an empty chunk.
  Result<Lines> read_chunk(ChunkID id) const;

  // Appends when id == chunk_count(), overwrites when id < chunk_count().
  Result<void> write_chunk(ChunkID id, const Lines &lines);

  // Installs already compressed chunks and advances total_lines() by `added`
  // as a single step. Fails without side effects if any id is out of range
  // or total_lines() is no longer `expected_total`.
  Result<void> commit(LineNo expected_total, std::span<const Staged> chunks,
                      uint64_t added);

  // Null when the chunk does not exist.
  CompressedChunk snapshot(ChunkID id) const;

  LineNo total_lines() const;
  std::size_t chunk_count() const;
  uint64_t compressed_size() const;

  uint32_t chunk_size() const {
    return chunk_size_;
  }

  const Codec &codec() const {
    return *codec_;
  }

  void reset();

private:
  void store_locked(ChunkID id, CompressedChunk data);

  std::shared_ptr<const Codec> codec_;
  uint32_t chunk_size_;

  mutable std::mutex mutex_;
  std::vector<CompressedChunk> chunks_;
  LineNo total_lines_ = 0;
  uint64_t compressed_size_ = 0;

  friend class ::ChunkStoreTest;
};

}  // namespace chunkview
