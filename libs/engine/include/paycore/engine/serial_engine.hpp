#pragma once

#include "paycore/engine/engine.hpp"

namespace paycore {
namespace engine {

// Applies every record on the calling thread, in order.
class SerialEngine final : public Engine {
 public:
  explicit SerialEngine(ledger::LedgerStore& store);

  void process(const ledger::TransactionRecord& record) override;
  void finish() override;
  [[nodiscard]] EngineStats stats() const override { return stats_; }

 private:
  ledger::LedgerStore& store_;
  EngineStats stats_{};
  bool finished_{false};
};

}  // namespace engine
}  // namespace paycore
