#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "paycore/common/types.hpp"
#include "paycore/ledger/account_ledger.hpp"

namespace paycore {
namespace ledger {

// Owns every AccountLedger of a run. Ledgers are node-allocated, so a
// reference returned by get_or_create() stays valid while other clients are
// inserted; the stream engine relies on this to hand one ledger to each worker.
class LedgerStore {
 public:
  explicit LedgerStore(WithdrawalDisputePolicy policy = WithdrawalDisputePolicy::kMirror);

  AccountLedger& get_or_create(common::ClientId client);
  [[nodiscard]] const AccountLedger* find(common::ClientId client) const;

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] bool empty() const noexcept { return accounts_.empty(); }
  [[nodiscard]] WithdrawalDisputePolicy policy() const noexcept { return policy_; }

  // One snapshot per client, ascending client id.
  [[nodiscard]] std::vector<AccountSnapshot> snapshot() const;

 private:
  WithdrawalDisputePolicy policy_;
  std::map<common::ClientId, AccountLedger> accounts_{};
};

}  // namespace ledger
}  // namespace paycore
