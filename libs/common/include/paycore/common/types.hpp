#pragma once

#include <cstdint>
#include <string_view>

namespace paycore {
namespace common {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Deposits and withdrawals move money and are retained for later disputes.
inline constexpr bool moves_funds(TransactionKind kind) noexcept {
  return kind == TransactionKind::kDeposit || kind == TransactionKind::kWithdrawal;
}

inline constexpr std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

}  // namespace common
}  // namespace paycore
