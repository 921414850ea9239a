#pragma once

#include "codec.hh"

#include <cstdint>
#include <string>

namespace chunkview {

struct SessionConfig {
  static constexpr uint32_t kDefaultChunkSize = 50'000;

  uint32_t chunk_size = kDefaultChunkSize;
  int compression_level = Codec::kDefaultLevel;
  // Shown for rows whose chunk is still being decompressed.
  std::string placeholder = "...";
};

// Any viewport must span at most two adjacent chunks.
Result<void> validate(const SessionConfig &config, uint32_t viewport_size);

}  // namespace chunkview
