#pragma once

#include "chunk.hh"
#include "errc.hh"

#include <memory>
#include <string>
#include <string_view>

namespace chunkview {

struct Codec;
using CodecPtr = std::unique_ptr<Codec>;

// Stateless line-sequence codec. Implementations must be safe to call from
// several threads at once.
struct Codec {  // NOLINT
  static constexpr int kDefaultLevel = 6;

  virtual ~Codec() = default;
  virtual std::string_view name() const = 0;

  // Lines must not contain '\n'.
  virtual Result<std::string> compress(const Lines& lines) const = 0;
  virtual Result<Lines> decompress(std::string_view data) const = 0;

  static Result<CodecPtr> gzip(int level = kDefaultLevel);
};

}  // namespace chunkview
