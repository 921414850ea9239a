#pragma once

#include "window_manager.hh"

namespace chunkview {

// Appends lines at the logical end of the document. Every chunk the append
// touches is rebuilt and compressed before anything is stored, so a failed
// append leaves the store exactly as it was.
//
// Not reentrant: callers must not run two appends at once.
class IngestionPipeline : NonCopyable {
public:
  IngestionPipeline(std::shared_ptr<ChunkStore> store,
                    std::shared_ptr<WindowManager> window);

  Result<void> append(const Lines &lines);

private:
  Result<Lines> tail_content(ChunkID id, uint32_t expected) const;

  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<WindowManager> window_;
};

}  // namespace chunkview
