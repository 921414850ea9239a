#pragma once

namespace chunkview {
struct NonCopyable {
  NonCopyable() = default;
  NonCopyable(const NonCopyable &) = delete;
  NonCopyable(NonCopyable &&) = default;
  NonCopyable &operator=(const NonCopyable &) = delete;
  NonCopyable &operator=(NonCopyable &&) = default;
  ~NonCopyable() = default;
};

// For objects whose address is captured by callbacks.
struct Pinned {
  Pinned() = default;
  Pinned(const Pinned &) = delete;
  Pinned(Pinned &&) = delete;
  Pinned &operator=(const Pinned &) = delete;
  Pinned &operator=(Pinned &&) = delete;
  ~Pinned() = default;
};
}  // namespace chunkview
