#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace wid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Exactly one value is reported per failed identifier operation; format checks win over
// calendar checks.
enum class WidError {
  kInvalidW,            // digit width W is zero or too wide for a 64-bit counter
  kInvalidZ,            // reserved: Z is unsigned, so this is not reachable today
  kInvalidNode,         // HLC node is empty or contains a char outside [A-Za-z0-9_]
  kInvalidRemoteClock,  // pt/lc passed to observe() or restore_state() is negative or past max_tick
  kInvalidState,        // persisted plain-WID state is negative or past max_tick
  kInvalidFormat,       // string does not match the identifier grammar
  kInvalidTimestamp,    // grammar matched but the calendar date-time is illegal
};

// describe returns a stable, human-readable message for a WidError.
[[nodiscard]] constexpr std::string_view describe(const WidError error) noexcept {
  switch (error) {
    case WidError::kInvalidW:
      return "Invalid W parameter: must be > 0";
    case WidError::kInvalidZ:
      return "Invalid Z parameter: must be >= 0";
    case WidError::kInvalidNode:
      return "Invalid node format";
    case WidError::kInvalidRemoteClock:
      return "Invalid remote clock values";
    case WidError::kInvalidState:
      return "Invalid generator state";
    case WidError::kInvalidFormat:
      return "Invalid WID format";
    case WidError::kInvalidTimestamp:
      return "Invalid timestamp in WID";
  }
  return "Unknown WID error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  // Mutable access lets callers drive a stateful value (e.g. a generator) in place.
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace wid::core
