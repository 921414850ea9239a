#pragma once

#include "chunk_store.hh"
#include "executor.hh"

#include <array>
#include <functional>
#include <optional>

class WindowManagerTest;

namespace chunkview {

// Keeps at most three adjacent chunks decompressed (previous, current, next)
// and serves viewport reads from them. Moving the viewport to another chunk
// schedules a reload on the executor; until it lands the affected rows read
// as the placeholder.
class WindowManager : NonCopyable,
                      public std::enable_shared_from_this<WindowManager> {
public:
  using RepaintFn = std::function<void()>;

  enum Slot : uint8_t { kPrevious = 0, kCurrent = 1, kNext = 2 };

  WindowManager(std::shared_ptr<ChunkStore> store, Executor &executor,
                std::string placeholder);

  // Always returns `size` strings without blocking on the codec.
  std::vector<std::string> resolve(LineNo start, uint32_t size);

  // Called after every reload that changed the window. May run on the
  // executor thread, and must not call reset().
  void set_repaint(RepaintFn fn);

  // Copy of the decompressed lines of `id` if the window holds an up to date
  // buffer for it.
  std::optional<Lines> resident_lines(ChunkID id) const;

  // Installs freshly written content for `id` if the window covers it.
  void refresh(ChunkID id, const CompressedChunk &source, const Lines &lines);

  // Forgets all buffers and invalidates in-flight reloads. Once it returns
  // no repaint from an earlier reload is running or will run.
  void reset();

  std::optional<ChunkID> current_chunk() const;
  // True between a cache miss and the reload that answers it.
  bool loading() const;
  std::size_t resident_count() const;

private:
  struct Buffer {
    std::optional<ChunkID> id;
    CompressedChunk source;
    Lines lines;

    void clear() {
      id.reset();
      source.reset();
      Lines l;
      std::swap(lines, l);
    }
  };

  struct Ticket {
    uint64_t epoch;
    ChunkID target;
  };

  static std::optional<ChunkID> neighbor(ChunkID target, Slot slot);

  void reload(Ticket ticket);
  bool commit(Ticket ticket, Slot slot, CompressedChunk source, Lines lines,
              bool valid);
  const Buffer *find_locked(ChunkID id) const;

  std::shared_ptr<ChunkStore> store_;
  Executor &executor_;
  std::string placeholder_;

  // Lock order: repaint_mutex_, mutex_, then the store's mutex.
  std::mutex repaint_mutex_;
  mutable std::mutex mutex_;
  std::array<Buffer, 3> buffers_;
  std::optional<ChunkID> current_;
  uint64_t epoch_ = 0;
  bool loading_ = false;
  RepaintFn repaint_;

  friend class ::WindowManagerTest;
};

}  // namespace chunkview
