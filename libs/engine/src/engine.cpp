#include "paycore/engine/engine.hpp"

#include <string>

#include "paycore/common/log.hpp"
#include "paycore/engine/serial_engine.hpp"
#include "paycore/engine/stream_engine.hpp"

namespace paycore {
namespace engine {

namespace {

std::string describe(const ledger::TransactionRecord& record) {
  std::string text = "[client " + std::to_string(record.client) + "] " +
                     std::string(common::to_string(record.kind)) + " tx " + std::to_string(record.tx);
  if (record.amount) {
    text += " amount " + record.amount->to_string();
  }
  return text;
}

}  // namespace

std::string_view to_string(EngineMode mode) noexcept {
  switch (mode) {
    case EngineMode::kSerial:
      return "serial";
    case EngineMode::kStream:
      return "stream";
  }
  return "unknown";
}

std::optional<EngineMode> parse_engine_mode(std::string_view name) noexcept {
  if (name == "serial") {
    return EngineMode::kSerial;
  }
  if (name == "stream") {
    return EngineMode::kStream;
  }
  return std::nullopt;
}

void EngineStats::record(ledger::ApplyResult result) noexcept {
  ++processed;
  if (result == ledger::ApplyResult::kApplied) {
    ++applied;
  } else {
    ++dropped;
  }
  ++by_result[static_cast<std::size_t>(result)];
}

void EngineStats::merge(const EngineStats& other) noexcept {
  processed += other.processed;
  applied += other.applied;
  dropped += other.dropped;
  for (std::size_t idx = 0; idx < by_result.size(); ++idx) {
    by_result[idx] += other.by_result[idx];
  }
}

std::uint64_t EngineStats::count(ledger::ApplyResult result) const noexcept {
  return by_result[static_cast<std::size_t>(result)];
}

std::unique_ptr<Engine> make_engine(EngineMode mode, ledger::LedgerStore& store) {
  switch (mode) {
    case EngineMode::kSerial:
      return std::make_unique<SerialEngine>(store);
    case EngineMode::kStream:
      return std::make_unique<StreamEngine>(store);
  }
  return std::make_unique<SerialEngine>(store);
}

ledger::ApplyResult apply_logged(ledger::AccountLedger& account, const ledger::TransactionRecord& record) {
  if (common::log_enabled(common::LogLevel::kDebug)) {
    common::log_debug("processing " + describe(record));
  }
  const auto result = account.apply(record);
  if (result != ledger::ApplyResult::kApplied && common::log_enabled(common::LogLevel::kInfo)) {
    common::log_info("dropped " + describe(record) + ": " + std::string(ledger::to_string(result)));
  }
  return result;
}

}  // namespace engine
}  // namespace paycore
