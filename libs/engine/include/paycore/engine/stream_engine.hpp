#pragma once

#include <cstddef>
#include <map>
#include <memory>

#include "paycore/common/types.hpp"
#include "paycore/engine/engine.hpp"

namespace paycore {
namespace engine {

// Dispatches records to one worker thread per client. Each worker owns the
// mutation rights of its client's ledger for the whole run, so ledgers are
// never shared between threads and need no locking. Per-client order is
// preserved; cross-client order is not.
class StreamEngine final : public Engine {
 public:
  explicit StreamEngine(ledger::LedgerStore& store);
  ~StreamEngine() override;

  StreamEngine(const StreamEngine&) = delete;
  StreamEngine& operator=(const StreamEngine&) = delete;

  void process(const ledger::TransactionRecord& record) override;

  // Signals end of input, joins every worker and folds their stats. If any
  // worker failed, the failure of the lowest client id is rethrown.
  void finish() override;

  [[nodiscard]] EngineStats stats() const override { return stats_; }
  [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

 private:
  class Worker;

  ledger::LedgerStore& store_;
  std::map<common::ClientId, std::unique_ptr<Worker>> workers_;
  EngineStats stats_{};
  bool finished_{false};
};

}  // namespace engine
}  // namespace paycore
