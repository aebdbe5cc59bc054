#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "paycore/common/log.hpp"
#include "paycore/engine/engine.hpp"
#include "paycore/ledger/account_ledger.hpp"

namespace paycore {
namespace config {

struct EngineSection {
  std::string mode{"serial"};
};

struct LedgerSection {
  std::string withdrawal_disputes{"mirror"};
};

struct LoggingSection {
  std::string level{"warn"};
};

struct EngineConfig {
  EngineSection engine;
  LedgerSection ledger;
  LoggingSection logging;

  // Typed views; only meaningful once validate() reported no errors.
  [[nodiscard]] paycore::engine::EngineMode engine_mode() const;
  [[nodiscard]] paycore::ledger::WithdrawalDisputePolicy withdrawal_dispute_policy() const;
  [[nodiscard]] common::LogLevel log_level() const;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paycore
