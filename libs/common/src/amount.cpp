#include "paycore/common/amount.hpp"

#include <limits>

namespace paycore {
namespace common {

namespace {

constexpr std::int64_t kMaxScaled = std::numeric_limits<std::int64_t>::max();

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

}  // namespace

std::string_view to_string(ParseErrorCode code) noexcept {
  switch (code) {
    case ParseErrorCode::kInvalidAmount:
      return "invalid amount";
    case ParseErrorCode::kPrecisionExceeded:
      return "precision exceeded";
    case ParseErrorCode::kOverflow:
      return "overflow";
    case ParseErrorCode::kNegativeAmount:
      return "negative amount";
    case ParseErrorCode::kMissingAmount:
      return "missing amount";
    case ParseErrorCode::kUnknownType:
      return "unknown transaction type";
    case ParseErrorCode::kInvalidField:
      return "invalid field";
  }
  return "unknown";
}

Amount Amount::parse(std::string_view text) {
  const std::string original(text);
  if (text.empty()) {
    throw ParseError(ParseErrorCode::kInvalidAmount, "empty amount");
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  std::string_view whole = text;
  std::string_view fraction{};
  if (const auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
  }

  if (whole.empty() && fraction.empty()) {
    throw ParseError(ParseErrorCode::kInvalidAmount, "amount has no digits: '" + original + "'");
  }
  for (const char c : whole) {
    if (!is_digit(c)) {
      throw ParseError(ParseErrorCode::kInvalidAmount, "malformed amount: '" + original + "'");
    }
  }
  for (const char c : fraction) {
    if (!is_digit(c)) {
      throw ParseError(ParseErrorCode::kInvalidAmount, "malformed amount: '" + original + "'");
    }
  }

  // Trailing zeros carry no precision: "1.50000" is 1.5.
  while (fraction.size() > static_cast<std::size_t>(kFractionDigits) && fraction.back() == '0') {
    fraction.remove_suffix(1);
  }
  if (fraction.size() > static_cast<std::size_t>(kFractionDigits)) {
    throw ParseError(ParseErrorCode::kPrecisionExceeded,
                     "more than 4 fractional digits: '" + original + "'");
  }

  std::int64_t magnitude = 0;
  for (const char c : whole) {
    const std::int64_t digit = c - '0';
    if (magnitude > (kMaxScaled - digit) / 10) {
      throw ParseError(ParseErrorCode::kOverflow, "amount out of range: '" + original + "'");
    }
    magnitude = magnitude * 10 + digit;
  }
  if (magnitude > kMaxScaled / kScale) {
    throw ParseError(ParseErrorCode::kOverflow, "amount out of range: '" + original + "'");
  }
  magnitude *= kScale;

  std::int64_t fractional = 0;
  std::int64_t place = kScale;
  for (const char c : fraction) {
    place /= 10;
    fractional += (c - '0') * place;
  }
  if (magnitude > kMaxScaled - fractional) {
    throw ParseError(ParseErrorCode::kOverflow, "amount out of range: '" + original + "'");
  }
  magnitude += fractional;

  return Amount{negative ? -magnitude : magnitude};
}

Amount Amount::add(Amount other) const {
  if ((other.scaled_ > 0 && scaled_ > kMaxScaled - other.scaled_) ||
      (other.scaled_ < 0 && scaled_ < std::numeric_limits<std::int64_t>::min() - other.scaled_)) {
    throw ArithmeticOverflow("amount addition overflow: " + to_string() + " + " + other.to_string());
  }
  return Amount{scaled_ + other.scaled_};
}

Amount Amount::subtract(Amount other) const {
  if ((other.scaled_ < 0 && scaled_ > kMaxScaled + other.scaled_) ||
      (other.scaled_ > 0 && scaled_ < std::numeric_limits<std::int64_t>::min() + other.scaled_)) {
    throw ArithmeticOverflow("amount subtraction overflow: " + to_string() + " - " + other.to_string());
  }
  return Amount{scaled_ - other.scaled_};
}

std::string Amount::to_string() const {
  // Widen before negating so the minimum value renders.
  const bool negative = scaled_ < 0;
  const auto magnitude = negative ? static_cast<std::uint64_t>(-(scaled_ + 1)) + 1U
                                  : static_cast<std::uint64_t>(scaled_);
  const auto whole = magnitude / static_cast<std::uint64_t>(kScale);
  auto fraction = magnitude % static_cast<std::uint64_t>(kScale);

  std::string digits(kFractionDigits, '0');
  for (int idx = kFractionDigits - 1; idx >= 0; --idx) {
    digits[static_cast<std::size_t>(idx)] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += digits;
  return out;
}

}  // namespace common
}  // namespace paycore
