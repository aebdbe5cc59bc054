#include "paycore/engine/pipeline.hpp"

namespace paycore {
namespace engine {

std::uint64_t run(TransactionSource& source, Engine& engine) {
  std::uint64_t read = 0;
  ledger::TransactionRecord record;
  while (source.next(record)) {
    ++read;
    engine.process(record);
  }
  engine.finish();
  return read;
}

void emit(const ledger::LedgerStore& store, SnapshotSink& sink) {
  const auto snapshots = store.snapshot();
  for (const auto& snapshot : snapshots) {
    sink.write(snapshot);
  }
  sink.flush();
}

}  // namespace engine
}  // namespace paycore
