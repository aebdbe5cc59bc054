#include "test_engine.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>
#include "paycore/engine/engine.hpp"
#include "paycore/engine/pipeline.hpp"
#include "paycore/engine/serial_engine.hpp"
#include "paycore/engine/stream_engine.hpp"
#include "paycore/ledger/ledger_store.hpp"

namespace paycore::tests {

namespace {

using common::Amount;
using common::TransactionKind;
using ledger::TransactionRecord;

class VectorSource final : public engine::TransactionSource {
 public:
  explicit VectorSource(std::vector<TransactionRecord> records) : records_(std::move(records)) {}

  bool next(TransactionRecord& out) override {
    if (position_ == records_.size()) {
      return false;
    }
    out = records_[position_++];
    return true;
  }

 private:
  std::vector<TransactionRecord> records_;
  std::size_t position_{0};
};

class CaptureSink final : public engine::SnapshotSink {
 public:
  void write(const ledger::AccountSnapshot& snapshot) override { rows.push_back(snapshot); }
  void flush() override { ++flushes; }

  std::vector<ledger::AccountSnapshot> rows;
  int flushes{0};
};

// Random mix of all five kinds over a small client population. Disputes
// reference earlier tx ids of any client, plus ids that never existed.
std::vector<TransactionRecord> generate_records(std::uint32_t seed, std::size_t count, common::ClientId clients) {
  std::mt19937 rng{seed};
  std::uniform_int_distribution<int> kind_dist(0, 99);
  std::uniform_int_distribution<int> client_dist(1, clients);
  std::uniform_int_distribution<std::int64_t> amount_dist(1, 500'000);

  std::vector<TransactionRecord> records;
  records.reserve(count);
  common::TransactionId next_tx = 1;
  while (records.size() < count) {
    const auto roll = kind_dist(rng);
    const auto client = static_cast<common::ClientId>(client_dist(rng));
    if (roll < 40) {
      records.push_back({.kind = TransactionKind::kDeposit,
                         .client = client,
                         .tx = next_tx++,
                         .amount = Amount::from_scaled(amount_dist(rng))});
    } else if (roll < 65) {
      records.push_back({.kind = TransactionKind::kWithdrawal,
                         .client = client,
                         .tx = next_tx++,
                         .amount = Amount::from_scaled(amount_dist(rng))});
    } else {
      std::uniform_int_distribution<common::TransactionId> tx_dist(1, next_tx + 5);
      const auto kind = roll < 80   ? TransactionKind::kDispute
                        : roll < 93 ? TransactionKind::kResolve
                                    : TransactionKind::kChargeback;
      records.push_back({.kind = kind, .client = client, .tx = tx_dist(rng)});
    }
  }
  return records;
}

std::vector<ledger::AccountSnapshot> run_with(engine::EngineMode mode, const std::vector<TransactionRecord>& records,
                                              ledger::WithdrawalDisputePolicy policy, engine::EngineStats* stats) {
  ledger::LedgerStore store{policy};
  auto processor = engine::make_engine(mode, store);
  VectorSource source{records};
  const auto read = engine::run(source, *processor);
  assert(read == records.size());
  if (stats != nullptr) {
    *stats = processor->stats();
  }
  return store.snapshot();
}

}  // namespace

void test_serial_engine() {
  ledger::LedgerStore store;
  engine::SerialEngine serial{store};
  serial.process({.kind = TransactionKind::kDeposit, .client = 1, .tx = 1, .amount = Amount::parse("10.0")});
  serial.process({.kind = TransactionKind::kWithdrawal, .client = 1, .tx = 2, .amount = Amount::parse("3.0")});
  serial.process({.kind = TransactionKind::kWithdrawal, .client = 2, .tx = 3, .amount = Amount::parse("1.0")});
  serial.process({.kind = TransactionKind::kDispute, .client = 1, .tx = 42});
  serial.finish();

  assert(store.size() == 2);
  const auto* first = store.find(1);
  assert(first != nullptr);
  assert(first->available() == Amount::parse("7.0"));
  assert(first->held() == Amount{});
  assert(first->total() == Amount::parse("7.0"));
  assert(!first->locked());

  // A client seen only through a rejected record still gets an empty ledger.
  const auto* second = store.find(2);
  assert(second != nullptr);
  assert(second->total() == Amount{});

  const auto stats = serial.stats();
  assert(stats.processed == 4);
  assert(stats.applied == 2);
  assert(stats.dropped == 2);
  assert(stats.count(ledger::ApplyResult::kInsufficientFunds) == 1);
  assert(stats.count(ledger::ApplyResult::kUnknownTransaction) == 1);

  bool threw = false;
  try {
    serial.process({.kind = TransactionKind::kDispute, .client = 1, .tx = 1});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void test_stream_engine() {
  ledger::LedgerStore store;
  engine::StreamEngine stream{store};
  for (common::TransactionId tx = 1; tx <= 300; ++tx) {
    const auto client = static_cast<common::ClientId>(tx % 3 + 1);
    stream.process({.kind = TransactionKind::kDeposit, .client = client, .tx = tx, .amount = Amount::parse("1.5")});
  }
  stream.process({.kind = TransactionKind::kDispute, .client = 1, .tx = 3});
  stream.process({.kind = TransactionKind::kChargeback, .client = 1, .tx = 3});
  stream.process({.kind = TransactionKind::kDeposit, .client = 1, .tx = 1'000, .amount = Amount::parse("5.0")});
  stream.process({.kind = TransactionKind::kDispute, .client = 2, .tx = 3});
  assert(stream.worker_count() == 3);
  stream.finish();
  stream.finish();

  const auto* first = store.find(1);
  assert(first->locked());
  assert(first->available() == Amount::parse("148.5"));
  assert(first->held() == Amount{});

  const auto* second = store.find(2);
  assert(!second->locked());
  assert(second->total() == Amount::parse("150.0"));

  const auto stats = stream.stats();
  assert(stats.processed == 304);
  assert(stats.applied == 302);
  assert(stats.count(ledger::ApplyResult::kAccountLocked) == 1);
  assert(stats.count(ledger::ApplyResult::kUnknownTransaction) == 1);

  // Records after end of input are refused, never queued to a joined worker.
  bool threw = false;
  try {
    stream.process({.kind = TransactionKind::kDeposit, .client = 2, .tx = 2'000, .amount = Amount::parse("1.0")});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(second->find(2'000) == nullptr);
  assert(stream.stats().processed == 304);
}

void test_engines_equivalent() {
  for (const auto policy : {ledger::WithdrawalDisputePolicy::kMirror, ledger::WithdrawalDisputePolicy::kReject}) {
    for (std::uint32_t seed : {7U, 1'234U, 99'991U}) {
      const auto records = generate_records(seed, 4'000, 25);

      engine::EngineStats serial_stats;
      engine::EngineStats stream_stats;
      const auto serial = run_with(engine::EngineMode::kSerial, records, policy, &serial_stats);
      const auto stream = run_with(engine::EngineMode::kStream, records, policy, &stream_stats);

      assert(!serial.empty());
      assert(serial == stream);
      assert(serial_stats.processed == stream_stats.processed);
      assert(serial_stats.by_result == stream_stats.by_result);
    }
  }
}

void test_stream_engine_overflow() {
  ledger::LedgerStore store;
  engine::StreamEngine stream{store};
  const auto huge = Amount::from_scaled(std::numeric_limits<std::int64_t>::max());
  stream.process({.kind = TransactionKind::kDeposit, .client = 9, .tx = 1, .amount = huge});
  stream.process({.kind = TransactionKind::kDeposit, .client = 2, .tx = 2, .amount = Amount::parse("4.0")});
  stream.process({.kind = TransactionKind::kDeposit, .client = 9, .tx = 3, .amount = Amount::parse("1.0")});
  stream.process({.kind = TransactionKind::kDeposit, .client = 9, .tx = 4, .amount = Amount::parse("0")});
  stream.process({.kind = TransactionKind::kDeposit, .client = 2, .tx = 5, .amount = Amount::parse("1.0")});

  bool threw = false;
  try {
    stream.finish();
  } catch (const common::ArithmeticOverflow&) {
    threw = true;
  }
  assert(threw);

  // The failing worker stopped before mutating; its sibling finished normally.
  assert(store.find(9)->available() == huge);
  assert(store.find(9)->find(4) == nullptr);
  assert(store.find(2)->available() == Amount::parse("5.0"));
}

void test_stream_engine_total_overflow() {
  ledger::LedgerStore store;
  engine::StreamEngine stream{store};
  const auto huge = Amount::from_scaled(std::numeric_limits<std::int64_t>::max());
  stream.process({.kind = TransactionKind::kDeposit, .client = 1, .tx = 1, .amount = huge});
  stream.process({.kind = TransactionKind::kDispute, .client = 1, .tx = 1});
  stream.process({.kind = TransactionKind::kDeposit, .client = 1, .tx = 2, .amount = Amount::parse("0.0001")});
  stream.process({.kind = TransactionKind::kDeposit, .client = 3, .tx = 3, .amount = Amount::parse("2.0")});

  bool threw = false;
  try {
    stream.finish();
  } catch (const common::ArithmeticOverflow&) {
    threw = true;
  }
  assert(threw);
  assert(stream.stats().applied == 3);

  // Every ledger left behind still has a representable total.
  const auto snapshots = store.snapshot();
  assert(snapshots.size() == 2);
  assert(snapshots[0].held == huge);
  assert(snapshots[0].total == huge);
  assert(snapshots[1].total == Amount::parse("2.0"));
}

void test_serial_engine_overflow() {
  ledger::LedgerStore store;
  auto processor = engine::make_engine(engine::EngineMode::kSerial, store);
  const auto huge = Amount::from_scaled(std::numeric_limits<std::int64_t>::max());
  VectorSource source{{
      {.kind = TransactionKind::kDeposit, .client = 1, .tx = 1, .amount = huge},
      {.kind = TransactionKind::kDeposit, .client = 1, .tx = 2, .amount = huge},
  }};

  bool threw = false;
  try {
    (void)engine::run(source, *processor);
  } catch (const common::ArithmeticOverflow&) {
    threw = true;
  }
  assert(threw);
}

void test_pipeline_emit() {
  ledger::LedgerStore store;
  auto processor = engine::make_engine(engine::EngineMode::kStream, store);
  VectorSource source{{
      {.kind = TransactionKind::kDeposit, .client = 5, .tx = 1, .amount = Amount::parse("2.0")},
      {.kind = TransactionKind::kDeposit, .client = 3, .tx = 2, .amount = Amount::parse("1.0")},
      {.kind = TransactionKind::kDispute, .client = 3, .tx = 2},
  }};
  assert(engine::run(source, *processor) == 3);

  CaptureSink sink;
  engine::emit(store, sink);
  assert(sink.flushes == 1);
  assert(sink.rows.size() == 2);
  assert(sink.rows[0].client == 3);
  assert(sink.rows[0].held == Amount::parse("1.0"));
  assert(sink.rows[0].total == Amount::parse("1.0"));
  assert(sink.rows[1].client == 5);
  assert(sink.rows[1].available == Amount::parse("2.0"));

  assert(engine::parse_engine_mode("stream") == engine::EngineMode::kStream);
  assert(engine::parse_engine_mode("serial") == engine::EngineMode::kSerial);
  assert(!engine::parse_engine_mode("parallel"));
}

}  // namespace paycore::tests
