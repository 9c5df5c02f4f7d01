#include "wid/id/async_api.h"

#include "wid/id/hlc_generator.h"
#include "wid/id/wid_generator.h"

#include <utility>

namespace wid::id {

std::future<AsyncIdResult> async_next_wid(const int w, const std::size_t z,
                                          const core::TimeUnit unit) {
  return std::async(std::launch::async, [w, z, unit]() {
    auto gen = WidGen::create(w, z, unit);
    if (!gen.has_value()) {
      return AsyncIdResult::err(gen.error());
    }
    return AsyncIdResult::ok(gen.value().next());
  });
}

std::future<AsyncIdResult> async_next_hlc_wid(std::string node, const int w, const std::size_t z,
                                              const core::TimeUnit unit) {
  return std::async(std::launch::async, [node = std::move(node), w, z, unit]() {
    auto gen = HlcWidGen::create(node, w, z, unit);
    if (!gen.has_value()) {
      return AsyncIdResult::err(gen.error());
    }
    return AsyncIdResult::ok(gen.value().next());
  });
}

std::future<AsyncStreamResult> async_wid_stream(const int w, const std::size_t z,
                                                const core::TimeUnit unit,
                                                const std::size_t count, IdSink sink) {
  return std::async(std::launch::async, [w, z, unit, count, sink = std::move(sink)]() {
    auto gen = WidGen::create(w, z, unit);
    if (!gen.has_value()) {
      return AsyncStreamResult::err(gen.error());
    }
    return AsyncStreamResult::ok(stream_ids(gen.value(), count, sink));
  });
}

std::future<AsyncStreamResult> async_hlc_wid_stream(std::string node, const int w,
                                                    const std::size_t z,
                                                    const core::TimeUnit unit,
                                                    const std::size_t count, IdSink sink) {
  return std::async(std::launch::async,
                    [node = std::move(node), w, z, unit, count, sink = std::move(sink)]() {
                      auto gen = HlcWidGen::create(node, w, z, unit);
                      if (!gen.has_value()) {
                        return AsyncStreamResult::err(gen.error());
                      }
                      return AsyncStreamResult::ok(stream_ids(gen.value(), count, sink));
                    });
}

}  // namespace wid::id
