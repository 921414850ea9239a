#pragma once

#include "line_source.hh"
#include "session.hh"

class ChunkLoaderTest;

namespace chunkview {

// Switches a viewer between its normal in-memory store and chunked storage.
// While enabled the viewer is read-only and reads its lines through the
// session's window.
class ChunkLoader : Pinned {
public:
  ChunkLoader(ViewerHost &viewer, Executor &executor);
  ~ChunkLoader();

  // Fails before touching any state if the viewport does not fit in a chunk.
  Result<void> activate(uint32_t chunk_size = SessionConfig::kDefaultChunkSize);
  Result<void> activate(SessionConfig config);

  void deactivate();

  // Discards the document but stays in chunked mode.
  void clear();

  Result<void> append_lines(const Lines &lines, bool skip_render = false);

  bool enabled() const {
    return session_ != nullptr;
  }

  LineNo total_lines() const;
  std::size_t chunk_count() const;
  uint64_t compressed_size() const;
  int64_t last_index() const;

private:
  ViewerHost &viewer_;
  Executor &executor_;
  std::unique_ptr<Session> session_;
  std::unique_ptr<ChunkedLineSource> source_;

  friend class ::ChunkLoaderTest;
};

}  // namespace chunkview
