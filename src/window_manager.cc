#include "window_manager.hh"
#include "log.hh"

namespace chunkview {

WindowManager::WindowManager(std::shared_ptr<ChunkStore> store,
                             Executor &executor, std::string placeholder)
    : store_(std::move(store)),
      executor_(executor),
      placeholder_(std::move(placeholder)) {}

std::vector<std::string> WindowManager::resolve(LineNo start, uint32_t size) {
  auto chunk_size = store_->chunk_size();
  if (!addressable(start, size, chunk_size)) {
    return std::vector<std::string>(size);
  }
  auto requested = chunk_of(start, chunk_size);

  std::unique_lock lock(mutex_);
  if (current_ != requested) {
    // Setting current_ first makes a repeated miss for the same chunk a hit.
    current_ = requested;
    loading_ = true;
    Ticket ticket{.epoch = epoch_, .target = requested};
    lock.unlock();

    CV_DEBUGF("window moves to chunk {} for line {}", requested, start);
    executor_.post([weak = weak_from_this(), ticket] {
      if (auto self = weak.lock()) {
        self->reload(ticket);
      }
    });
    return std::vector<std::string>(size, placeholder_);
  }

  auto total = store_->total_lines();
  std::vector<std::string> ret;
  ret.reserve(size);
  for (auto &v : calculate_chunk_views(start, size, chunk_size)) {
    const auto *buf = find_locked(v.id_);
    for (uint32_t i = 0; i < v.length_; i++) {
      auto off = v.offset_ + i;
      auto line = static_cast<LineNo>(v.id_) * chunk_size + off;
      if (buf != nullptr && off < buf->lines.size()) {
        ret.push_back(buf->lines[off]);
      } else if (buf == nullptr && loading_ && line < total) {
        ret.push_back(placeholder_);
      } else {
        ret.emplace_back();
      }
    }
  }
  return ret;
}

void WindowManager::set_repaint(RepaintFn fn) {
  std::lock_guard lock(mutex_);
  repaint_ = std::move(fn);
}

std::optional<Lines> WindowManager::resident_lines(ChunkID id) const {
  std::lock_guard lock(mutex_);
  const auto *buf = find_locked(id);
  if (buf == nullptr || buf->source == nullptr ||
      buf->source != store_->snapshot(id)) {
    return std::nullopt;
  }
  return buf->lines;
}

void WindowManager::refresh(ChunkID id, const CompressedChunk &source,
                            const Lines &lines) {
  std::lock_guard lock(mutex_);
  if (!current_) {
    return;
  }
  for (auto slot : {kPrevious, kCurrent, kNext}) {
    auto &buf = buffers_[slot];
    if (neighbor(*current_, slot) == id) {
      buf.id = id;
      buf.source = source;
      buf.lines = lines;
      CV_TRACEF("chunk {} refreshed in place, {} lines", id, lines.size());
    } else if (buf.id == id) {
      // left over from the layout before a pending move
      buf.clear();
    }
  }
}

void WindowManager::reset() {
  // waits for a repaint that is already running
  std::lock_guard repaint_lock(repaint_mutex_);
  std::lock_guard lock(mutex_);
  epoch_++;
  current_.reset();
  loading_ = false;
  for (auto &b : buffers_) {
    b.clear();
  }
}

std::optional<ChunkID> WindowManager::current_chunk() const {
  std::lock_guard lock(mutex_);
  return current_;
}

bool WindowManager::loading() const {
  std::lock_guard lock(mutex_);
  return loading_;
}

std::size_t WindowManager::resident_count() const {
  std::lock_guard lock(mutex_);
  std::size_t n = 0;
  for (auto &b : buffers_) {
    n += b.id.has_value() ? 1 : 0;
  }
  return n;
}

std::optional<ChunkID> WindowManager::neighbor(ChunkID target, Slot slot) {
  switch (slot) {
  case kPrevious:
    if (target == 0) {
      return std::nullopt;
    }
    return target - 1;
  case kCurrent:
    return target;
  case kNext:
    if (target == std::numeric_limits<ChunkID>::max()) {
      return std::nullopt;
    }
    return target + 1;
  }
  return std::nullopt;
}

void WindowManager::reload(Ticket ticket) {
  // current first, it covers the visible rows
  for (auto slot : {kCurrent, kPrevious, kNext}) {
    auto id = neighbor(ticket.target, slot);
    CompressedChunk source = id ? store_->snapshot(*id) : nullptr;
    Lines lines;
    bool valid = true;
    if (source != nullptr) {
      auto res = store_->codec().decompress(*source);
      if (res) {
        lines = std::move(res).value();
      } else {
        CV_ERRORF("can not decompress chunk {}: {}", *id, res.error());
        valid = false;
      }
    }
    if (!commit(ticket, slot, std::move(source), std::move(lines), valid)) {
      CV_DEBUGF("reload of chunk {} superseded, dropped", ticket.target);
      return;
    }
  }

  // Held across the callback so reset() can not return while it runs.
  std::lock_guard repaint_lock(repaint_mutex_);
  RepaintFn repaint;
  {
    std::lock_guard lock(mutex_);
    if (ticket.epoch != epoch_ || current_ != ticket.target) {
      return;
    }
    loading_ = false;
    repaint = repaint_;
  }
  CV_DEBUGF("window at chunk {} loaded", ticket.target);
  if (repaint) {
    repaint();
  }
}

bool WindowManager::commit(Ticket ticket, Slot slot, CompressedChunk source,
                           Lines lines, bool valid) {
  std::lock_guard lock(mutex_);
  if (ticket.epoch != epoch_ || current_ != ticket.target) {
    return false;
  }

  auto &buf = buffers_[slot];
  auto id = neighbor(ticket.target, slot);
  if (!id) {
    buf.clear();
    return true;
  }
  if (store_->snapshot(*id) != source) {
    // rewritten by an append after we read it, refresh() installs that one
    return true;
  }
  if (source == nullptr) {
    buf.clear();
    return true;
  }
  buf.id = id;
  buf.source = valid ? std::move(source) : nullptr;
  buf.lines = std::move(lines);
  return true;
}

const WindowManager::Buffer *WindowManager::find_locked(ChunkID id) const {
  for (const auto &b : buffers_) {
    if (b.id == id) {
      return &b;
    }
  }
  return nullptr;
}

}  // namespace chunkview
