#pragma once

#include <optional>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

// A decoded input row. `amount` is set for deposits and withdrawals only.
struct TransactionRecord {
  common::TransactionKind kind{common::TransactionKind::kDeposit};
  common::ClientId client{0};
  common::TransactionId tx{0};
  std::optional<common::Amount> amount{};
};

}  // namespace ledger
}  // namespace paycore
