#pragma once

#include <cstddef>
#include <random>
#include <string>

namespace wid::core {

// Abstract source of collision-resistance padding.
// Allows production code to draw random hex while tests/demos use a fixed pattern.
class IPaddingSource {
 public:
  virtual ~IPaddingSource() = default;

  // Return exactly `count` lowercase hex characters [0-9a-f].
  virtual std::string hex(std::size_t count) = 0;

 protected:
  IPaddingSource() = default;
  IPaddingSource(const IPaddingSource&) = default;
  IPaddingSource& operator=(const IPaddingSource&) = default;
  IPaddingSource(IPaddingSource&&) = default;
  IPaddingSource& operator=(IPaddingSource&&) = default;
};

// Production padding: each character drawn independently and uniformly.
// Not thread-safe; one instance per generator.
class SystemPaddingSource final : public IPaddingSource {
 public:
  SystemPaddingSource();
  ~SystemPaddingSource() override = default;

  SystemPaddingSource(const SystemPaddingSource&) = delete;
  SystemPaddingSource& operator=(const SystemPaddingSource&) = delete;
  SystemPaddingSource(SystemPaddingSource&&) = delete;
  SystemPaddingSource& operator=(SystemPaddingSource&&) = delete;

  std::string hex(std::size_t count) override;

 private:
  std::mt19937_64 engine_;
  std::uniform_int_distribution<int> nibble_{0, 15};
};

// Deterministic padding: cycles through a fixed pattern.
// For tests where reproducible output is required.
class FixedPaddingSource final : public IPaddingSource {
 public:
  explicit FixedPaddingSource(std::string pattern) : pattern_(std::move(pattern)) {}
  ~FixedPaddingSource() override = default;

  FixedPaddingSource(const FixedPaddingSource&) = default;
  FixedPaddingSource& operator=(const FixedPaddingSource&) = default;
  FixedPaddingSource(FixedPaddingSource&&) = default;
  FixedPaddingSource& operator=(FixedPaddingSource&&) = default;

  std::string hex(std::size_t count) override;

 private:
  std::string pattern_;
};

}  // namespace wid::core
