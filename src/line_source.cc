#include "line_source.hh"
#include "session.hh"

namespace chunkview {

std::vector<std::string> NormalLineSource::lines(LineNo start, uint32_t size) {
  std::vector<std::string> ret(size);
  for (uint32_t i = 0; i < size && start + i < lines_.size(); i++) {
    ret[i] = lines_[start + i];
  }
  return ret;
}

Result<void> NormalLineSource::append_lines(const Lines &lines) {
  lines_.insert(lines_.end(), lines.begin(), lines.end());
  return outcome::success();
}

void NormalLineSource::clear() {
  Lines l;
  std::swap(lines_, l);
}

LineNo ChunkedLineSource::line_count() const {
  return session_.store().total_lines();
}

std::vector<std::string> ChunkedLineSource::lines(LineNo start,
                                                  uint32_t size) {
  return session_.resolve(start, size);
}

Result<void> ChunkedLineSource::append_lines(const Lines &lines) {
  return session_.append(lines);
}

void ChunkedLineSource::clear() {
  session_.clear();
}

bool ChunkedLineSource::settled() const {
  return !session_.window().loading();
}

}  // namespace chunkview
