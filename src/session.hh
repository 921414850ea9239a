#pragma once

#include "config.hh"
#include "ingestion.hh"

namespace chunkview {

// Everything chunked mode owns: the store, the decompressed window and the
// append path, all sharing one configuration.
class Session : Pinned {
public:
  static Result<std::unique_ptr<Session>> create(SessionConfig config,
                                                 Executor &executor);

  Session(SessionConfig config, CodecPtr codec, Executor &executor);
  ~Session();

  std::vector<std::string> resolve(LineNo start, uint32_t size) {
    return window_->resolve(start, size);
  }

  Result<void> append(const Lines &lines) {
    return pipeline_.append(lines);
  }

  // Drops all chunks and buffers, keeps the configuration.
  void clear();

  const SessionConfig &config() const {
    return config_;
  }
  const ChunkStore &store() const {
    return *store_;
  }
  WindowManager &window() {
    return *window_;
  }
  const WindowManager &window() const {
    return *window_;
  }

private:
  SessionConfig config_;
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<WindowManager> window_;
  IngestionPipeline pipeline_;
};

}  // namespace chunkview
