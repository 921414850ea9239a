#include "chunk_loader.hh"
#include "log.hh"

namespace chunkview {

ChunkLoader::ChunkLoader(ViewerHost &viewer, Executor &executor)
    : viewer_(viewer), executor_(executor) {}

ChunkLoader::~ChunkLoader() {
  if (enabled()) {
    viewer_.use_line_source(nullptr);
  }
}

Result<void> ChunkLoader::activate(uint32_t chunk_size) {
  return activate(SessionConfig{.chunk_size = chunk_size});
}

Result<void> ChunkLoader::activate(SessionConfig config) {
  TRYV(validate(config, viewer_.viewport_size()));
  auto session = TRYX(Session::create(std::move(config), executor_));

  if (enabled()) {
    viewer_.use_line_source(nullptr);
  }
  source_ = std::make_unique<ChunkedLineSource>(*session);
  session_ = std::move(session);
  session_->window().set_repaint([&viewer = viewer_] { viewer.render(false); });

  viewer_.normal_source().clear();
  viewer_.set_edit_mode(EditMode::Navigate);
  viewer_.use_line_source(source_.get());
  CV_INFOF("chunked mode on, {} lines per chunk",
           session_->config().chunk_size);
  viewer_.render(true);
  return outcome::success();
}

void ChunkLoader::deactivate() {
  viewer_.use_line_source(nullptr);
  viewer_.set_edit_mode(EditMode::Write);
  source_.reset();
  if (session_) {
    CV_INFOF("chunked mode off, dropping {} lines in {} chunks",
             session_->store().total_lines(), session_->store().chunk_count());
    session_.reset();
  }
  viewer_.render(true);
}

void ChunkLoader::clear() {
  if (session_) {
    CV_INFOF("clearing {} lines", session_->store().total_lines());
    session_->clear();
  }
  viewer_.render(true);
}

Result<void> ChunkLoader::append_lines(const Lines &lines, bool skip_render) {
  if (!enabled()) {
    return make_error(Errc::not_activated, "call activate() first");
  }
  TRYV(session_->append(lines));
  if (!skip_render) {
    viewer_.render(false);
  }
  return outcome::success();
}

LineNo ChunkLoader::total_lines() const {
  return session_ ? session_->store().total_lines() : 0;
}

std::size_t ChunkLoader::chunk_count() const {
  return session_ ? session_->store().chunk_count() : 0;
}

uint64_t ChunkLoader::compressed_size() const {
  return session_ ? session_->store().compressed_size() : 0;
}

int64_t ChunkLoader::last_index() const {
  return static_cast<int64_t>(total_lines()) - 1;
}

}  // namespace chunkview
