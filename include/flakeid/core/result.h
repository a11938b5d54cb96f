#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace flakeid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class IdError {
  kInvalidConfiguration,  // node id outside [0, kMaxNodeId] or unparseable
  kClockRegression,       // wall clock moved behind the last issued timestamp
  kAlreadyCreated,        // a process-wide generator already exists
};

// to_string returns a stable, human-readable name for an IdError.
[[nodiscard]] constexpr std::string_view to_string(IdError error) {
  switch (error) {
    case IdError::kInvalidConfiguration:
      return "invalid_configuration";
    case IdError::kClockRegression:
      return "clock_regression";
    case IdError::kAlreadyCreated:
      return "already_created";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace flakeid::core
