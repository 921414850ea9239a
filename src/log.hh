// IWYU pragma: always_keep

#pragma once

#include <absl/log/log.h>
#include <fmt/format.h>

#define CV_IMPL_LOGF_(_log, _severity, _spec, ...) \
  _log(_severity) << fmt::format("[{}] " _spec,    \
                                 __func__ __VA_OPT__(, ) __VA_ARGS__)

#define CV_FATALF(...) CV_IMPL_LOGF_(LOG, FATAL, __VA_ARGS__)
#define CV_ERRORF(...) CV_IMPL_LOGF_(LOG, ERROR, __VA_ARGS__)
#define CV_WARNF(...) CV_IMPL_LOGF_(LOG, WARNING, __VA_ARGS__)
#define CV_INFOF(...) CV_IMPL_LOGF_(VLOG, 0, __VA_ARGS__)
#define CV_DEBUGF(...) CV_IMPL_LOGF_(VLOG, 1, __VA_ARGS__)
#define CV_TRACEF(...) CV_IMPL_LOGF_(VLOG, 2, __VA_ARGS__)
