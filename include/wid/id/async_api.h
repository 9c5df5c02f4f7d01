#pragma once

#include "wid/core/result.h"
#include "wid/core/time_unit.h"
#include "wid/id/id_stream.h"

#include <cstddef>
#include <future>
#include <string>

namespace wid::id {

// Future-based helpers that run a fresh generator on a worker thread.
// Each call owns its generator; no state is shared between calls.

using AsyncIdResult = core::Result<std::string, core::WidError>;
using AsyncStreamResult = core::Result<std::size_t, core::WidError>;

[[nodiscard]] std::future<AsyncIdResult> async_next_wid(int w, std::size_t z,
                                                        core::TimeUnit unit = core::TimeUnit::kSec);

[[nodiscard]] std::future<AsyncIdResult> async_next_hlc_wid(
    std::string node, int w, std::size_t z, core::TimeUnit unit = core::TimeUnit::kSec);

// Streams count identifiers (0 means until the sink declines) into sink from
// the worker thread. The sink must be safe to call from that thread.
[[nodiscard]] std::future<AsyncStreamResult> async_wid_stream(int w, std::size_t z,
                                                              core::TimeUnit unit,
                                                              std::size_t count, IdSink sink);

[[nodiscard]] std::future<AsyncStreamResult> async_hlc_wid_stream(std::string node, int w,
                                                                  std::size_t z,
                                                                  core::TimeUnit unit,
                                                                  std::size_t count, IdSink sink);

}  // namespace wid::id
