#include "ingestion.hh"
#include "log.hh"

#include <boost/container/small_vector.hpp>

namespace chunkview {

namespace {
struct StagedChunk {
  ChunkStore::Staged stored;
  Lines lines;
};
}  // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<ChunkStore> store,
                                     std::shared_ptr<WindowManager> window)
    : store_(std::move(store)), window_(std::move(window)) {}

Result<void> IngestionPipeline::append(const Lines &lines) {
  if (lines.empty()) {
    return outcome::success();
  }

  auto chunk_size = store_->chunk_size();
  auto total = store_->total_lines();
  if (!addressable(total, lines.size(), chunk_size)) {
    return make_error(Errc::chunk_out_of_range,
                      fmt::format("{} more lines after {} exceed the chunk ids",
                                  lines.size(), total));
  }
  auto id = chunk_of(total, chunk_size);
  auto filled = static_cast<uint32_t>(total % chunk_size);

  // most appends touch the open tail chunk and maybe one more
  boost::container::small_vector<StagedChunk, 2> staged;
  std::size_t pos = 0;
  while (pos < lines.size()) {
    Lines content;
    if (filled != 0) {
      content = TRYX(tail_content(id, filled));
    }

    auto take = std::min<std::size_t>(chunk_size - content.size(),
                                      lines.size() - pos);
    content.insert(content.end(), lines.begin() + pos,
                   lines.begin() + pos + take);
    pos += take;

    auto compressed = TRYX(store_->codec().compress(content));
    staged.push_back(StagedChunk{
        .stored = {.id = id,
                   .data = std::make_shared<const std::string>(
                       std::move(compressed))},
        .lines = std::move(content),
    });
    id++;
    filled = 0;
  }

  std::vector<ChunkStore::Staged> stored;
  stored.reserve(staged.size());
  for (auto &s : staged) {
    stored.push_back(s.stored);
  }
  TRYV(store_->commit(total, stored, lines.size()));

  for (auto &s : staged) {
    window_->refresh(s.stored.id, s.stored.data, s.lines);
  }
  CV_TRACEF("appended {} lines into {} chunks starting at {}", lines.size(),
            staged.size(), staged.front().stored.id);
  return outcome::success();
}

Result<Lines> IngestionPipeline::tail_content(ChunkID id,
                                              uint32_t expected) const {
  // The tail chunk is usually resident while a document streams in.
  if (auto resident = window_->resident_lines(id);
      resident && resident->size() == expected) {
    return std::move(*resident);
  }

  auto content = TRYX(store_->read_chunk(id));
  if (content.size() != expected) {
    return make_error(Errc::corrupted_chunk,
                      fmt::format("chunk {} holds {} lines, expected {}", id,
                                  content.size(), expected));
  }
  return content;
}

}  // namespace chunkview
