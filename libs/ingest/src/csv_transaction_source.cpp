#include "paycore/ingest/csv_transaction_source.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ingest {

namespace {

constexpr std::size_t kMaxFields = 4;

std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view kBlank = " \t\r\n";
  const auto first = text.find_first_not_of(kBlank);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kBlank);
  return text.substr(first, last - first + 1);
}

std::string at_line(std::size_t line, const std::string& message) {
  return "line " + std::to_string(line) + ": " + message;
}

std::optional<common::TransactionKind> parse_kind(std::string_view name) noexcept {
  for (auto kind : {common::TransactionKind::kDeposit, common::TransactionKind::kWithdrawal,
                    common::TransactionKind::kDispute, common::TransactionKind::kResolve,
                    common::TransactionKind::kChargeback}) {
    if (name == common::to_string(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

template <typename T>
T parse_id(std::string_view text, std::string_view field, std::size_t line) {
  std::uint64_t value = 0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc{} || ptr != end || value > std::numeric_limits<T>::max()) {
    throw common::ParseError(common::ParseErrorCode::kInvalidField,
                             at_line(line, "invalid " + std::string(field) + " '" + std::string(text) + "'"),
                             line);
  }
  return static_cast<T>(value);
}

common::Amount parse_amount(std::string_view text, std::size_t line) {
  try {
    const auto amount = common::Amount::parse(text);
    if (amount.is_negative()) {
      throw common::ParseError(common::ParseErrorCode::kNegativeAmount,
                               at_line(line, "negative amount '" + std::string(text) + "'"), line);
    }
    return amount;
  } catch (const common::ParseError& err) {
    if (err.line() != 0) {
      throw;
    }
    throw common::ParseError(err.code(), at_line(line, err.what()), line);
  }
}

}  // namespace

std::optional<ledger::TransactionRecord> decode_row(std::string_view row, std::size_t line) {
  if (trim(row).empty()) {
    return std::nullopt;
  }

  std::array<std::string_view, kMaxFields> fields{};
  std::size_t count = 0;
  while (true) {
    const auto comma = row.find(',');
    if (count == kMaxFields) {
      throw common::ParseError(common::ParseErrorCode::kInvalidField,
                               at_line(line, "too many columns"), line);
    }
    fields[count++] = trim(row.substr(0, comma));
    if (comma == std::string_view::npos) {
      break;
    }
    row.remove_prefix(comma + 1);
  }

  if (count < 3) {
    throw common::ParseError(common::ParseErrorCode::kInvalidField,
                             at_line(line, "expected type, client and tx columns"), line);
  }

  const auto kind = parse_kind(fields[0]);
  if (!kind) {
    throw common::ParseError(common::ParseErrorCode::kUnknownType,
                             at_line(line, "unknown transaction type '" + std::string(fields[0]) + "'"),
                             line);
  }

  ledger::TransactionRecord record{
      .kind = *kind,
      .client = parse_id<common::ClientId>(fields[1], "client", line),
      .tx = parse_id<common::TransactionId>(fields[2], "tx", line),
  };

  if (common::moves_funds(record.kind)) {
    if (count < 4 || fields[3].empty()) {
      throw common::ParseError(common::ParseErrorCode::kMissingAmount,
                               at_line(line, std::string(common::to_string(record.kind)) + " requires an amount"),
                               line);
    }
    record.amount = parse_amount(fields[3], line);
  }
  return record;
}

CsvTransactionSource::CsvTransactionSource(std::istream& input) : input_(input) {}

bool CsvTransactionSource::next(ledger::TransactionRecord& out) {
  std::string row;
  while (std::getline(input_, row)) {
    ++line_;
    if (!seen_first_row_ && !trim(row).empty()) {
      seen_first_row_ = true;
      const auto first_column = trim(std::string_view(row).substr(0, row.find(',')));
      if (first_column == "type") {
        continue;
      }
    }
    if (auto record = decode_row(row, line_)) {
      out = std::move(*record);
      return true;
    }
  }
  if (input_.bad()) {
    throw std::runtime_error(at_line(line_, "failed to read transaction input"));
  }
  return false;
}

}  // namespace ingest
}  // namespace paycore
