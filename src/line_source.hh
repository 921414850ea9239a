#pragma once

#include "chunk.hh"
#include "errc.hh"
#include "noncopyable.hh"

namespace chunkview {

class Session;

// Where the hosting viewer gets its lines from.
struct LineSource {  // NOLINT
  virtual ~LineSource() = default;

  virtual LineNo line_count() const = 0;
  virtual std::vector<std::string> lines(LineNo start, uint32_t size) = 0;
  virtual Result<void> append_lines(const Lines &lines) = 0;
  virtual void clear() = 0;

  // False while lines() may still be returning placeholders.
  virtual bool settled() const {
    return true;
  }

  int64_t last_index() const {
    return static_cast<int64_t>(line_count()) - 1;
  }
};

// Plain in-memory store used while the document is small.
class NormalLineSource final : public LineSource, NonCopyable {
public:
  NormalLineSource() = default;
  explicit NormalLineSource(Lines lines) : lines_(std::move(lines)) {}

  LineNo line_count() const final {
    return lines_.size();
  }
  std::vector<std::string> lines(LineNo start, uint32_t size) final;
  Result<void> append_lines(const Lines &lines) final;
  void clear() final;

private:
  Lines lines_;
};

class ChunkedLineSource final : public LineSource, NonCopyable {
public:
  explicit ChunkedLineSource(Session &session) : session_(session) {}

  LineNo line_count() const final;
  std::vector<std::string> lines(LineNo start, uint32_t size) final;
  Result<void> append_lines(const Lines &lines) final;
  void clear() final;
  bool settled() const final;

private:
  Session &session_;
};

enum class EditMode : uint8_t {
  Write,
  Navigate,  // scroll only
};

// What the chunked lifecycle needs from the viewer that hosts it.
struct ViewerHost {  // NOLINT
  virtual ~ViewerHost() = default;

  virtual uint32_t viewport_size() const = 0;
  virtual void set_edit_mode(EditMode mode) = 0;
  virtual LineSource &normal_source() = 0;
  // nullptr switches back to normal_source().
  virtual void use_line_source(LineSource *source) = 0;
  // Asks for a repaint, the viewer then queries its line source again.
  virtual void render(bool full) = 0;
};

}  // namespace chunkview
