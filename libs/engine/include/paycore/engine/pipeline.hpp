#pragma once

#include <cstdint>

#include "paycore/engine/engine.hpp"
#include "paycore/ledger/account_ledger.hpp"
#include "paycore/ledger/ledger_store.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace engine {

// Lazy, finite, ordered supplier of validated records.
class TransactionSource {
 public:
  virtual ~TransactionSource() = default;

  // Returns false once the input is exhausted. Throws common::ParseError on
  // a row that cannot be decoded.
  virtual bool next(ledger::TransactionRecord& out) = 0;
};

class SnapshotSink {
 public:
  virtual ~SnapshotSink() = default;

  virtual void write(const ledger::AccountSnapshot& snapshot) = 0;
  virtual void flush() {}
};

// Feeds the whole source through the engine and waits for it to finish.
// Returns the number of records read.
std::uint64_t run(TransactionSource& source, Engine& engine);

// Writes one snapshot per client in ascending client id. Snapshots are all
// computed before the first write, so a failure leaves the sink untouched.
void emit(const ledger::LedgerStore& store, SnapshotSink& sink);

}  // namespace engine
}  // namespace paycore
