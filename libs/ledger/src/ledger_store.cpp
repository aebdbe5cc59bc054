#include "paycore/ledger/ledger_store.hpp"

namespace paycore {
namespace ledger {

LedgerStore::LedgerStore(WithdrawalDisputePolicy policy) : policy_(policy) {}

AccountLedger& LedgerStore::get_or_create(common::ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, client, policy_);
  return it->second;
}

const AccountLedger* LedgerStore::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<AccountSnapshot> LedgerStore::snapshot() const {
  std::vector<AccountSnapshot> snapshots;
  snapshots.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    snapshots.push_back(account.snapshot());
  }
  return snapshots;
}

}  // namespace ledger
}  // namespace paycore
