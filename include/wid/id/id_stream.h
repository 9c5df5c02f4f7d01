#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace wid::id {

// IdSink receives each generated identifier; returning false stops the stream.
using IdSink = std::function<bool(const std::string&)>;

// stream_ids drives any generator exposing next() and pushes identifiers into
// sink in generation order. count == 0 streams until the sink declines.
// Returns the number of identifiers delivered.
template <typename Generator>
std::size_t stream_ids(Generator& gen, const std::size_t count, const IdSink& sink) {
  std::size_t emitted = 0;
  while (count == 0 || emitted < count) {
    const std::string id = gen.next();
    ++emitted;
    if (!sink(id)) {
      break;
    }
  }
  return emitted;
}

}  // namespace wid::id
