#include "session.hh"

namespace chunkview {

Result<std::unique_ptr<Session>> Session::create(SessionConfig config,
                                                 Executor &executor) {
  auto codec = TRYX(Codec::gzip(config.compression_level));
  return std::make_unique<Session>(std::move(config), std::move(codec),
                                   executor);
}

Session::Session(SessionConfig config, CodecPtr codec, Executor &executor)
    : config_(std::move(config)),
      store_(std::make_shared<ChunkStore>(std::move(codec), config_.chunk_size)),
      window_(std::make_shared<WindowManager>(store_, executor,
                                              config_.placeholder)),
      pipeline_(store_, window_) {}

Session::~Session() {
  // reloads still queued may outlive us through their own references
  window_->reset();
}

void Session::clear() {
  window_->reset();
  store_->reset();
}

}  // namespace chunkview
