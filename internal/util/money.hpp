#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace chronicle::util {

/*
  Fixed-point amount in minor units (cents). All arithmetic stays in
  int64 cents; results that do not fit throw std::overflow_error.
*/
class Money {
 public:
  constexpr Money() = default;

  static constexpr Money FromCents(int64_t cents) {
    return Money(cents);
  }

  // Accepts "12", "12.3", "-12.34". Throws std::invalid_argument, also for
  // amounts beyond the int64 cents range.
  static Money Parse(const std::string& text);

  constexpr int64_t Cents() const {
    return cents_;
  }

  std::string ToString() const;

  // nullopt when the sum is outside the int64 cents range.
  constexpr std::optional<Money> CheckedAdd(Money other) const {
    if (other.cents_ > 0 && cents_ > kMax - other.cents_) return std::nullopt;
    if (other.cents_ < 0 && cents_ < kMin - other.cents_) return std::nullopt;
    return Money(cents_ + other.cents_);
  }

  constexpr Money operator+(Money other) const {
    return Checked(CheckedAdd(other));
  }
  constexpr Money operator-(Money other) const {
    return *this + -other;
  }
  constexpr Money operator-() const {
    if (cents_ == kMin) throw std::overflow_error("amount out of range");
    return Money(-cents_);
  }
  Money& operator+=(Money other) {
    return *this = *this + other;
  }
  Money& operator-=(Money other) {
    return *this = *this - other;
  }

  constexpr auto operator<=>(const Money&) const = default;

 private:
  static constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  static constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

  constexpr explicit Money(int64_t cents) : cents_(cents) {
  }

  static constexpr Money Checked(std::optional<Money> m) {
    if (!m) throw std::overflow_error("amount out of range");
    return *m;
  }

  int64_t cents_ = 0;
};

} // namespace chronicle::util
