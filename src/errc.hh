#pragma once

#include "outcome.hh"

#include <cstdint>

namespace chunkview {

enum class Errc : int8_t {
  not_activated = 1,
  invalid_configuration,
  chunk_out_of_range,
  invalid_line,
  codec_failure,
  corrupted_chunk,
  concurrent_append,
  io_error,
};

}  // namespace chunkview

SYSTEM_ERROR2_NAMESPACE_BEGIN
template <>
struct quick_status_code_from_enum<chunkview::Errc>
    : quick_status_code_from_enum_defaults<chunkview::Errc> {
  static constexpr auto domain_name = "chunkview::Errc";
  static constexpr auto domain_uuid = "3f0c2a7e-91d4-4b5e-8c61-5a2e7d9b04f3";
  static constexpr auto payload_uuid = "b7e41d09-6c3a-4f82-a5d8-1e9c3b72f6a0";
  static const std::initializer_list<mapping> &value_mappings() {
    // NOLINTBEGIN
    // clang-format off
    static const std::initializer_list<mapping> v = {
        {chunkview::Errc::not_activated, "chunked mode is not activated", {errc::operation_not_permitted}},
        {chunkview::Errc::invalid_configuration, "invalid configuration", {errc::invalid_argument}},
        {chunkview::Errc::chunk_out_of_range, "chunk index out of range", {errc::result_out_of_range}},
        {chunkview::Errc::invalid_line, "line contains a newline", {errc::invalid_argument}},
        {chunkview::Errc::codec_failure, "compression failed", {errc::io_error}},
        {chunkview::Errc::corrupted_chunk, "chunk data is corrupted", {errc::bad_message}},
        {chunkview::Errc::concurrent_append, "store changed during append", {errc::device_or_resource_busy}},
        {chunkview::Errc::io_error, "io error", {errc::io_error}},
    };
    // clang-format on
    // NOLINTEND
    return v;
  }
};
SYSTEM_ERROR2_NAMESPACE_END
