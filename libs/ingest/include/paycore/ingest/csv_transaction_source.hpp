#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string_view>

#include "paycore/engine/pipeline.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ingest {

// Decodes one `type,client,tx,amount` row. Returns nullopt for blank lines.
// Throws common::ParseError tagged with `line` on malformed rows.
std::optional<ledger::TransactionRecord> decode_row(std::string_view row, std::size_t line);

// Reads rows lazily from a stream. A leading header row is skipped, fields
// are trimmed, and the amount column may be absent for dispute, resolve and
// chargeback rows.
class CsvTransactionSource final : public engine::TransactionSource {
 public:
  explicit CsvTransactionSource(std::istream& input);

  bool next(ledger::TransactionRecord& out) override;

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  std::istream& input_;
  std::size_t line_{0};
  bool seen_first_row_{false};
};

}  // namespace ingest
}  // namespace paycore
