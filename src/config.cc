#include "config.hh"

namespace chunkview {

Result<void> validate(const SessionConfig &config, uint32_t viewport_size) {
  if (config.chunk_size == 0) {
    return make_error(Errc::invalid_configuration, "chunk size must be positive");
  }
  if (viewport_size >= config.chunk_size) {
    return make_error(Errc::invalid_configuration,
                      fmt::format("viewport {} can't be larger than chunk size {}",
                                  viewport_size, config.chunk_size));
  }
  if (config.compression_level < 0 || config.compression_level > 9) {
    return make_error(Errc::invalid_configuration,
                      fmt::format("compression level {} not in [0, 9]",
                                  config.compression_level));
  }
  return outcome::success();
}

}  // namespace chunkview
