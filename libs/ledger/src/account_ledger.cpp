#include "paycore/ledger/account_ledger.hpp"

#include <string>

namespace paycore {
namespace ledger {

std::string_view to_string(WithdrawalDisputePolicy policy) noexcept {
  switch (policy) {
    case WithdrawalDisputePolicy::kMirror:
      return "mirror";
    case WithdrawalDisputePolicy::kReject:
      return "reject";
  }
  return "unknown";
}

std::optional<WithdrawalDisputePolicy> parse_withdrawal_dispute_policy(std::string_view name) noexcept {
  if (name == "mirror") {
    return WithdrawalDisputePolicy::kMirror;
  }
  if (name == "reject") {
    return WithdrawalDisputePolicy::kReject;
  }
  return std::nullopt;
}

std::string_view to_string(ApplyResult result) noexcept {
  switch (result) {
    case ApplyResult::kApplied:
      return "applied";
    case ApplyResult::kAccountLocked:
      return "account locked";
    case ApplyResult::kInsufficientFunds:
      return "insufficient funds";
    case ApplyResult::kDuplicateTransaction:
      return "duplicate transaction id";
    case ApplyResult::kUnknownTransaction:
      return "unknown transaction";
    case ApplyResult::kClientMismatch:
      return "client mismatch";
    case ApplyResult::kAlreadyDisputed:
      return "already disputed";
    case ApplyResult::kNotDisputed:
      return "not disputed";
    case ApplyResult::kDisputeNotSupported:
      return "dispute not supported";
  }
  return "unknown";
}

AccountLedger::AccountLedger(common::ClientId client, WithdrawalDisputePolicy policy)
    : client_(client), policy_(policy) {}

ApplyResult AccountLedger::apply(const TransactionRecord& record) {
  if (record.client != client_) {
    return ApplyResult::kClientMismatch;
  }
  if (locked_) {
    return ApplyResult::kAccountLocked;
  }

  switch (record.kind) {
    case common::TransactionKind::kDeposit:
      return apply_deposit(record);
    case common::TransactionKind::kWithdrawal:
      return apply_withdrawal(record);
    case common::TransactionKind::kDispute:
      return apply_dispute(record.tx);
    case common::TransactionKind::kResolve:
      return apply_resolve(record.tx);
    case common::TransactionKind::kChargeback:
      return apply_chargeback(record.tx);
  }
  return ApplyResult::kUnknownTransaction;
}

const RecordedTransaction* AccountLedger::find(common::TransactionId tx) const {
  if (auto it = history_.find(tx); it != history_.end()) {
    return &it->second;
  }
  return nullptr;
}

AccountSnapshot AccountLedger::snapshot() const {
  return AccountSnapshot{
      .client = client_,
      .available = available_,
      .held = held_,
      .total = total(),
      .locked = locked_,
  };
}

ApplyResult AccountLedger::apply_deposit(const TransactionRecord& record) {
  const auto amount = require_amount(record);
  if (history_.contains(record.tx)) {
    return ApplyResult::kDuplicateTransaction;
  }
  commit(available_.add(amount), held_);
  history_.emplace(record.tx, RecordedTransaction{.kind = record.kind, .amount = amount});
  return ApplyResult::kApplied;
}

ApplyResult AccountLedger::apply_withdrawal(const TransactionRecord& record) {
  const auto amount = require_amount(record);
  if (history_.contains(record.tx)) {
    return ApplyResult::kDuplicateTransaction;
  }
  if (!common::is_sufficient(available_, amount)) {
    return ApplyResult::kInsufficientFunds;
  }
  commit(available_.subtract(amount), held_);
  history_.emplace(record.tx, RecordedTransaction{.kind = record.kind, .amount = amount});
  return ApplyResult::kApplied;
}

ApplyResult AccountLedger::apply_dispute(common::TransactionId tx) {
  auto it = history_.find(tx);
  if (it == history_.end()) {
    return ApplyResult::kUnknownTransaction;
  }
  auto& entry = it->second;
  if (entry.kind == common::TransactionKind::kWithdrawal &&
      policy_ == WithdrawalDisputePolicy::kReject) {
    return ApplyResult::kDisputeNotSupported;
  }
  if (entry.state != DisputeState::kNone && entry.state != DisputeState::kResolved) {
    return ApplyResult::kAlreadyDisputed;
  }

  const auto effect = signed_effect(entry);
  commit(available_.subtract(effect), held_.add(effect));
  entry.state = DisputeState::kDisputed;
  return ApplyResult::kApplied;
}

ApplyResult AccountLedger::apply_resolve(common::TransactionId tx) {
  auto it = history_.find(tx);
  if (it == history_.end()) {
    return ApplyResult::kUnknownTransaction;
  }
  auto& entry = it->second;
  if (entry.state != DisputeState::kDisputed) {
    return ApplyResult::kNotDisputed;
  }

  const auto effect = signed_effect(entry);
  commit(available_.add(effect), held_.subtract(effect));
  entry.state = DisputeState::kResolved;
  return ApplyResult::kApplied;
}

ApplyResult AccountLedger::apply_chargeback(common::TransactionId tx) {
  auto it = history_.find(tx);
  if (it == history_.end()) {
    return ApplyResult::kUnknownTransaction;
  }
  auto& entry = it->second;
  if (entry.state != DisputeState::kDisputed) {
    return ApplyResult::kNotDisputed;
  }

  commit(available_, held_.subtract(signed_effect(entry)));
  locked_ = true;
  entry.state = DisputeState::kChargedBack;
  return ApplyResult::kApplied;
}

common::Amount AccountLedger::signed_effect(const RecordedTransaction& entry) {
  if (entry.kind == common::TransactionKind::kWithdrawal) {
    return common::Amount{}.subtract(entry.amount);
  }
  return entry.amount;
}

void AccountLedger::commit(common::Amount available, common::Amount held) {
  const auto total = available.add(held);
  available_ = available;
  held_ = held;
  total_ = total;
}

common::Amount AccountLedger::require_amount(const TransactionRecord& record) {
  if (!record.amount) {
    throw common::ParseError(common::ParseErrorCode::kMissingAmount,
                             std::string(common::to_string(record.kind)) + " " +
                                 std::to_string(record.tx) + " has no amount");
  }
  return *record.amount;
}

}  // namespace ledger
}  // namespace paycore
