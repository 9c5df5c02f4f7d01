#include "wid/core/padding.h"

namespace wid::core {

namespace {

constexpr const char* kHexDigits = "0123456789abcdef";

}  // namespace

SystemPaddingSource::SystemPaddingSource() : engine_(std::random_device{}()) {}

std::string SystemPaddingSource::hex(const std::size_t count) {
  std::string out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(kHexDigits[nibble_(engine_)]);
  }
  return out;
}

std::string FixedPaddingSource::hex(const std::size_t count) {
  std::string out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(pattern_.empty() ? '0' : pattern_[i % pattern_.size()]);
  }
  return out;
}

}  // namespace wid::core
