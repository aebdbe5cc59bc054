#include "paycore/engine/serial_engine.hpp"

#include <stdexcept>

namespace paycore {
namespace engine {

SerialEngine::SerialEngine(ledger::LedgerStore& store) : store_(store) {}

void SerialEngine::process(const ledger::TransactionRecord& record) {
  if (finished_) {
    throw std::runtime_error("serial engine already finished");
  }
  auto& account = store_.get_or_create(record.client);
  stats_.record(apply_logged(account, record));
}

void SerialEngine::finish() {
  finished_ = true;
}

}  // namespace engine
}  // namespace paycore
