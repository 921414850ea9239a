#include "chunk_store.hh"
#include "log.hh"

#include <algorithm>
#include <cassert>

namespace chunkview {

ChunkStore::ChunkStore(std::shared_ptr<const Codec> codec, uint32_t chunk_size)
    : codec_(std::move(codec)), chunk_size_(chunk_size) {
  assert(codec_ != nullptr);
  assert(chunk_size_ > 0);
}

Result<Lines> ChunkStore::read_chunk(ChunkID id) const {
  auto data = snapshot(id);
  if (data == nullptr) {
    return Lines{};
  }
  return codec_->decompress(*data);
}

Result<void> ChunkStore::write_chunk(ChunkID id, const Lines &lines) {
  auto compressed = TRYX(codec_->compress(lines));

  std::lock_guard lock(mutex_);
  if (id > chunks_.size()) {
    return make_error(Errc::chunk_out_of_range,
                      fmt::format("write to chunk {} with {} chunks stored", id,
                                  chunks_.size()));
  }
  store_locked(id, std::make_shared<const std::string>(std::move(compressed)));
  return outcome::success();
}

Result<void> ChunkStore::commit(LineNo expected_total,
                                std::span<const Staged> chunks,
                                uint64_t added) {
  std::lock_guard lock(mutex_);
  if (total_lines_ != expected_total) {
    return make_error(Errc::concurrent_append,
                      fmt::format("expected {} lines, found {}", expected_total,
                                  total_lines_));
  }

  auto count = chunks_.size();
  for (auto &c : chunks) {
    if (c.id > count) {
      return make_error(
          Errc::chunk_out_of_range,
          fmt::format("staged chunk {} with {} chunks stored", c.id, count));
    }
    count = std::max<std::size_t>(count, c.id + 1);
  }

  for (auto &c : chunks) {
    store_locked(c.id, c.data);
  }
  total_lines_ += added;
  CV_TRACEF("{} chunks written, total {} lines in {} chunks", chunks.size(),
            total_lines_, chunks_.size());
  return outcome::success();
}

CompressedChunk ChunkStore::snapshot(ChunkID id) const {
  std::lock_guard lock(mutex_);
  if (id >= chunks_.size()) {
    return nullptr;
  }
  return chunks_[id];
}

LineNo ChunkStore::total_lines() const {
  std::lock_guard lock(mutex_);
  return total_lines_;
}

std::size_t ChunkStore::chunk_count() const {
  std::lock_guard lock(mutex_);
  return chunks_.size();
}

uint64_t ChunkStore::compressed_size() const {
  std::lock_guard lock(mutex_);
  return compressed_size_;
}

void ChunkStore::reset() {
  std::lock_guard lock(mutex_);
  chunks_.clear();
  total_lines_ = 0;
  compressed_size_ = 0;
}

void ChunkStore::store_locked(ChunkID id, CompressedChunk data) {
  assert(id <= chunks_.size());
  compressed_size_ += data->size();
  if (id < chunks_.size()) {
    compressed_size_ -= chunks_[id]->size();
    chunks_[id] = std::move(data);
  } else {
    chunks_.push_back(std::move(data));
  }
}

}  // namespace chunkview
