#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "paycore/ledger/account_ledger.hpp"
#include "paycore/ledger/ledger_store.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace engine {

enum class EngineMode : std::uint8_t {
  kSerial,
  kStream,
};

std::string_view to_string(EngineMode mode) noexcept;
std::optional<EngineMode> parse_engine_mode(std::string_view name) noexcept;

struct EngineStats {
  std::uint64_t processed{0};
  std::uint64_t applied{0};
  std::uint64_t dropped{0};
  std::array<std::uint64_t, ledger::kApplyResultCount> by_result{};

  void record(ledger::ApplyResult result) noexcept;
  void merge(const EngineStats& other) noexcept;
  [[nodiscard]] std::uint64_t count(ledger::ApplyResult result) const noexcept;
};

// Applies an ordered transaction stream to a LedgerStore. The store is owned
// by the caller and must outlive the engine. finish() must be called before
// the store is read; it rethrows any fatal error raised while applying.
class Engine {
 public:
  virtual ~Engine() = default;

  virtual void process(const ledger::TransactionRecord& record) = 0;
  virtual void finish() = 0;
  [[nodiscard]] virtual EngineStats stats() const = 0;
};

std::unique_ptr<Engine> make_engine(EngineMode mode, ledger::LedgerStore& store);

// Applies one record to its ledger and logs dropped records.
ledger::ApplyResult apply_logged(ledger::AccountLedger& account, const ledger::TransactionRecord& record);

}  // namespace engine
}  // namespace paycore
