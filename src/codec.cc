#include "codec.hh"
#include "log.hh"
#include "noncopyable.hh"

#include <zlib.h>

#include <array>

namespace chunkview {

namespace {

constexpr std::size_t kStreamWindow = 64 * 1024;

// windowBits: 15 + 16 writes a gzip header, 15 + 32 reads gzip or zlib.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kAutoWindowBits = 15 + 32;

Result<std::string> join_lines(const Lines& lines) {
  std::size_t size = 0;
  for (auto& l : lines) {
    size += l.size() + 1;
  }

  std::string text;
  text.reserve(size);
  for (std::size_t i = 0; i < lines.size(); i++) {
    if (lines[i].find('\n') != std::string::npos) {
      return make_error(Errc::invalid_line, fmt::format("line {} of {}", i,
                                                        lines.size()));
    }
    text.append(lines[i]);
    text.push_back('\n');
  }
  return text;
}

Lines split_lines(std::string_view text) {
  Lines ret;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      // unterminated tail, keep it as a line
      ret.emplace_back(text.substr(pos));
      break;
    }
    ret.emplace_back(text.substr(pos, end - pos));
    pos = end + 1;
  }
  return ret;
}

class GzipCodec final : public Codec, NonCopyable {
public:
  explicit GzipCodec(int level) : level_(level) {}

  std::string_view name() const final {
    return "gzip";
  }

  Result<std::string> compress(const Lines& lines) const final {
    auto text = TRYX(join_lines(lines));

    z_stream strm{};
    if (auto ret = deflateInit2(&strm, level_, Z_DEFLATED, kGzipWindowBits, 8,
                                Z_DEFAULT_STRATEGY);
        ret != Z_OK) {
      return make_error(Errc::codec_failure,
                        fmt::format("deflateInit2 returned {}", ret));
    }

    strm.next_in = reinterpret_cast<Bytef*>(text.data());  // NOLINT
    strm.avail_in = static_cast<uInt>(text.size());

    std::string out;
    std::array<Bytef, kStreamWindow> window{};
    int ret = Z_OK;
    do {
      strm.next_out = window.data();
      strm.avail_out = static_cast<uInt>(window.size());
      ret = deflate(&strm, Z_FINISH);
      if (ret == Z_STREAM_ERROR) {
        deflateEnd(&strm);
        return make_error(Errc::codec_failure, "deflate stream error");
      }
      out.append(reinterpret_cast<const char*>(window.data()),  // NOLINT
                 window.size() - strm.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    CV_TRACEF("{} lines, {} -> {} bytes", lines.size(), text.size(),
              out.size());
    return out;
  }

  Result<Lines> decompress(std::string_view data) const final {
    z_stream strm{};
    if (auto ret = inflateInit2(&strm, kAutoWindowBits); ret != Z_OK) {
      return make_error(Errc::corrupted_chunk,
                        fmt::format("inflateInit2 returned {}", ret));
    }

    strm.next_in =
        reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));  // NOLINT
    strm.avail_in = static_cast<uInt>(data.size());

    std::string text;
    std::array<Bytef, kStreamWindow> window{};
    int ret = Z_OK;
    do {
      strm.next_out = window.data();
      strm.avail_out = static_cast<uInt>(window.size());
      ret = inflate(&strm, Z_NO_FLUSH);
      if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
          ret == Z_STREAM_ERROR) {
        inflateEnd(&strm);
        return make_error(Errc::corrupted_chunk,
                          fmt::format("inflate returned {}", ret));
      }
      text.append(reinterpret_cast<const char*>(window.data()),  // NOLINT
                  window.size() - strm.avail_out);
      if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
        inflateEnd(&strm);
        return make_error(Errc::corrupted_chunk,
                          fmt::format("truncated after {} bytes", text.size()));
      }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return split_lines(text);
  }

private:
  int level_;
};

}  // namespace

Result<CodecPtr> Codec::gzip(int level) {
  if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
    return make_error(Errc::invalid_configuration,
                      fmt::format("compression level {} not in [0, 9]", level));
  }
  return std::make_unique<GzipCodec>(level);
}

}  // namespace chunkview
