#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace paycore {
namespace common {

enum class ParseErrorCode : std::uint8_t {
  kInvalidAmount,
  kPrecisionExceeded,
  kOverflow,
  kNegativeAmount,
  kMissingAmount,
  kUnknownType,
  kInvalidField,
};

std::string_view to_string(ParseErrorCode code) noexcept;

class ParseError : public std::runtime_error {
 public:
  ParseError(ParseErrorCode code, const std::string& what, std::size_t line = 0)
      : std::runtime_error(what), code_(code), line_(line) {}

  [[nodiscard]] ParseErrorCode code() const noexcept { return code_; }
  // 1-based input line, 0 when not raised from a row reader.
  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  ParseErrorCode code_;
  std::size_t line_;
};

class ArithmeticOverflow : public std::overflow_error {
 public:
  using std::overflow_error::overflow_error;
};

// Fixed-point money with four fractional digits, stored as value * 10'000.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() noexcept = default;

  static Amount parse(std::string_view text);
  static constexpr Amount from_scaled(std::int64_t scaled) noexcept { return Amount{scaled}; }

  [[nodiscard]] constexpr std::int64_t scaled() const noexcept { return scaled_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return scaled_ < 0; }

  // Throw ArithmeticOverflow instead of wrapping.
  [[nodiscard]] Amount add(Amount other) const;
  [[nodiscard]] Amount subtract(Amount other) const;

  [[nodiscard]] std::string to_string() const;

  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;

 private:
  constexpr explicit Amount(std::int64_t scaled) noexcept : scaled_(scaled) {}

  std::int64_t scaled_{0};
};

inline constexpr bool is_sufficient(Amount balance, Amount amount) noexcept {
  return balance >= amount;
}

}  // namespace common
}  // namespace paycore
