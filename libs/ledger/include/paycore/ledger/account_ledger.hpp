#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

enum class DisputeState : std::uint8_t {
  kNone,
  kDisputed,
  kResolved,
  kChargedBack,
};

// How disputes referencing a withdrawal are treated.
enum class WithdrawalDisputePolicy : std::uint8_t {
  kMirror,  // inverse of the deposit effect: the withdrawn funds come back under dispute
  kReject,  // withdrawals cannot be disputed
};

std::string_view to_string(WithdrawalDisputePolicy policy) noexcept;
std::optional<WithdrawalDisputePolicy> parse_withdrawal_dispute_policy(std::string_view name) noexcept;

enum class ApplyResult : std::uint8_t {
  kApplied,
  kAccountLocked,
  kInsufficientFunds,
  kDuplicateTransaction,
  kUnknownTransaction,
  kClientMismatch,
  kAlreadyDisputed,
  kNotDisputed,
  kDisputeNotSupported,
};

inline constexpr std::size_t kApplyResultCount = 9;

std::string_view to_string(ApplyResult result) noexcept;

struct RecordedTransaction {
  common::TransactionKind kind{common::TransactionKind::kDeposit};
  common::Amount amount{};
  DisputeState state{DisputeState::kNone};
};

struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};

  friend bool operator==(const AccountSnapshot&, const AccountSnapshot&) = default;
};

// Balances and dispute history of one client.
//
// Every deposit and withdrawal is retained by tx id so that later disputes can
// find the original amount. Rejected transactions leave the ledger untouched;
// the only exception escaping apply() is common::ArithmeticOverflow, and it is
// thrown before any field is modified.
class AccountLedger {
 public:
  explicit AccountLedger(common::ClientId client,
                         WithdrawalDisputePolicy policy = WithdrawalDisputePolicy::kMirror);

  ApplyResult apply(const TransactionRecord& record);

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] common::Amount total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }
  [[nodiscard]] WithdrawalDisputePolicy policy() const noexcept { return policy_; }

  [[nodiscard]] const RecordedTransaction* find(common::TransactionId tx) const;
  [[nodiscard]] std::size_t history_size() const noexcept { return history_.size(); }

  [[nodiscard]] AccountSnapshot snapshot() const;

 private:
  ApplyResult apply_deposit(const TransactionRecord& record);
  ApplyResult apply_withdrawal(const TransactionRecord& record);
  ApplyResult apply_dispute(common::TransactionId tx);
  ApplyResult apply_resolve(common::TransactionId tx);
  ApplyResult apply_chargeback(common::TransactionId tx);

  // Amount moved into the account by the entry: +a for deposits, -a for
  // withdrawals. Disputes shift this value from available to held.
  static common::Amount signed_effect(const RecordedTransaction& entry);
  static common::Amount require_amount(const TransactionRecord& record);

  // Stores new balances once their sum is known to be representable.
  void commit(common::Amount available, common::Amount held);

  common::ClientId client_;
  WithdrawalDisputePolicy policy_;
  common::Amount available_{};
  common::Amount held_{};
  common::Amount total_{};
  bool locked_{false};
  std::unordered_map<common::TransactionId, RecordedTransaction> history_{};
};

}  // namespace ledger
}  // namespace paycore
