#include "chunk_loader.hh"
#include "log.hh"

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/initialize.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>

ABSL_FLAG(uint32_t, chunk_size, chunkview::SessionConfig::kDefaultChunkSize,
          "lines per compressed chunk");
ABSL_FLAG(uint32_t, viewport, 40, "number of lines to print");
ABSL_FLAG(uint64_t, start, 0, "first line to print, 0-based");
ABSL_FLAG(uint32_t, batch, 10'000, "lines handed to each append");
ABSL_FLAG(int, level, chunkview::Codec::kDefaultLevel, "gzip level, 0-9");

namespace chunkview {

// Prints one viewport to stdout. render() only wakes up the waiting main
// thread, which then queries the line source again.
class PrintViewer final : public ViewerHost, Pinned {
public:
  explicit PrintViewer(uint32_t viewport_size)
      : viewport_size_(viewport_size) {}

  uint32_t viewport_size() const final {
    return viewport_size_;
  }

  void set_edit_mode(EditMode mode) final {
    mode_ = mode;
  }

  LineSource &normal_source() final {
    return normal_;
  }

  void use_line_source(LineSource *source) final {
    active_ = source != nullptr ? source : &normal_;
  }

  void render(bool full) final {
    {
      std::lock_guard lock(mutex_);
      repaints_++;
    }
    CV_TRACEF("render requested, full={} navigate={}", full,
              mode_ == EditMode::Navigate);
    cv_.notify_all();
  }

  // Re-queries until the rows were produced without a reload in flight.
  void print(LineNo start) {
    while (true) {
      uint64_t seen = 0;
      {
        std::lock_guard lock(mutex_);
        seen = repaints_;
      }
      auto rows = active_->lines(start, viewport_size_);
      std::unique_lock lock(mutex_);
      if (!active_->settled()) {
        cv_.wait(lock, [&] { return repaints_ != seen; });
        continue;
      }
      if (repaints_ != seen) {
        continue;
      }
      lock.unlock();
      for (uint32_t i = 0; i < rows.size(); i++) {
        if (start + i >= active_->line_count()) {
          break;
        }
        fmt::print("{:>8} {}\n", start + i + 1, rows[i]);
      }
      return;
    }
  }

private:
  uint32_t viewport_size_;
  std::atomic<EditMode> mode_ = EditMode::Write;
  NormalLineSource normal_;
  LineSource *active_ = &normal_;

  std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t repaints_ = 0;
};

Result<void> load_file(ChunkLoader &loader, const char *path, uint32_t batch) {
  std::ifstream in(path);
  if (!in) {
    return make_error(Errc::io_error, fmt::format("can not open {}", path));
  }

  Lines lines;
  lines.reserve(batch);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(std::move(line));
    if (lines.size() == batch) {
      TRYV(loader.append_lines(lines, true));
      lines.clear();
    }
  }
  if (in.bad()) {
    return make_error(Errc::io_error, fmt::format("read error on {}", path));
  }
  if (!lines.empty()) {
    TRYV(loader.append_lines(lines, true));
  }
  return outcome::success();
}

Result<void> run(const char *path) {
  SessionConfig config{
      .chunk_size = absl::GetFlag(FLAGS_chunk_size),
      .compression_level = absl::GetFlag(FLAGS_level),
  };
  auto batch = std::max<uint32_t>(absl::GetFlag(FLAGS_batch), 1);

  WorkerExecutor executor;
  PrintViewer viewer(absl::GetFlag(FLAGS_viewport));
  ChunkLoader loader(viewer, executor);

  TRYV(loader.activate(std::move(config)));
  TRYV(load_file(loader, path, batch));
  CV_INFOF("{}: {} lines in {} chunks, {} bytes compressed", path,
           loader.total_lines(), loader.chunk_count(),
           loader.compressed_size());

  viewer.print(absl::GetFlag(FLAGS_start));
  loader.deactivate();
  return outcome::success();
}

}  // namespace chunkview

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage("chunkview [flags] FILE");
  auto args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (args.size() != 2) {
    fmt::print(stderr, "usage: {} [flags] FILE\n", args[0]);
    return 2;
  }

  try {
    auto res = chunkview::run(args[1]);
    if (!res) {
      fmt::print(stderr, "{}\n", res.error());
      return 1;
    }
  } catch (const std::exception &ex) {
    fmt::print(stderr, "{}\n", ex.what());
    return 1;
  }
  return 0;
}
