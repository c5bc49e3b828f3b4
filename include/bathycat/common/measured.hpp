#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace bathycat {

/// Presence of a sensor field. There is deliberately no conversion to bool:
/// a coordinate of exactly 0.0 is a real value, not a missing one.
enum class FieldState : uint8_t {
  kAbsent  = 0,  // not reported by the source
  kInvalid = 1,  // reported, but outside its physical range
  kValid   = 2,
};

/// A value that carries its own presence state.
template <typename T>
class Measured {
public:
  Measured() = default;

  static Measured valid(T value) { return Measured(FieldState::kValid, std::move(value)); }
  static Measured invalid(T raw) { return Measured(FieldState::kInvalid, std::move(raw)); }
  static Measured absent() { return Measured(); }

  FieldState state() const { return state_; }
  bool is_valid() const { return state_ == FieldState::kValid; }
  bool is_invalid() const { return state_ == FieldState::kInvalid; }
  bool is_absent() const { return state_ == FieldState::kAbsent; }

  /// Throws std::logic_error unless the field is valid.
  const T& value() const {
    if (state_ != FieldState::kValid) {
      throw std::logic_error("Measured::value() on a field that is not valid");
    }
    return value_;
  }

  T value_or(T fallback) const {
    return state_ == FieldState::kValid ? value_ : std::move(fallback);
  }

  /// Raw reported value, also for kInvalid. Meaningless when absent.
  const T& raw() const { return value_; }

  bool operator==(const Measured& other) const {
    if (state_ != other.state_) return false;
    return state_ == FieldState::kAbsent || value_ == other.value_;
  }
  bool operator!=(const Measured& other) const { return !(*this == other); }

private:
  Measured(FieldState state, T value) : state_(state), value_(std::move(value)) {}

  FieldState state_ = FieldState::kAbsent;
  T value_{};
};

}  // namespace bathycat
