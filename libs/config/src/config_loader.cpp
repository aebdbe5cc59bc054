#include "paycore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace paycore {
namespace config {

namespace {

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

EngineSection parse_engine(const toml::table& root) {
  EngineSection cfg;
  if (auto* section = root["engine"].as_table()) {
    cfg.mode = get_str_or(*section, "mode", cfg.mode);
  }
  return cfg;
}

LedgerSection parse_ledger(const toml::table& root) {
  LedgerSection cfg;
  if (auto* section = root["ledger"].as_table()) {
    cfg.withdrawal_disputes = get_str_or(*section, "withdrawal_disputes", cfg.withdrawal_disputes);
  }
  return cfg;
}

LoggingSection parse_logging(const toml::table& root) {
  LoggingSection cfg;
  if (auto* section = root["logging"].as_table()) {
    cfg.level = get_str_or(*section, "level", cfg.level);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.engine = parse_engine(root);
  cfg.ledger = parse_ledger(root);
  cfg.logging = parse_logging(root);
  return cfg;
}

LoadResult finish_load(const toml::table& root) {
  LoadResult result;
  result.config = parse_config(root);
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

paycore::engine::EngineMode EngineConfig::engine_mode() const {
  return paycore::engine::parse_engine_mode(engine.mode).value_or(paycore::engine::EngineMode::kSerial);
}

paycore::ledger::WithdrawalDisputePolicy EngineConfig::withdrawal_dispute_policy() const {
  return paycore::ledger::parse_withdrawal_dispute_policy(ledger.withdrawal_disputes)
      .value_or(paycore::ledger::WithdrawalDisputePolicy::kMirror);
}

common::LogLevel EngineConfig::log_level() const {
  return common::parse_log_level(logging.level).value_or(common::LogLevel::kWarn);
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish_load(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish_load(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (!engine::parse_engine_mode(config.engine.mode)) {
    errors.push_back({"engine.mode", "must be \"serial\" or \"stream\", got \"" + config.engine.mode + "\""});
  }

  if (!ledger::parse_withdrawal_dispute_policy(config.ledger.withdrawal_disputes)) {
    errors.push_back({"ledger.withdrawal_disputes",
                      "must be \"mirror\" or \"reject\", got \"" + config.ledger.withdrawal_disputes + "\""});
  }

  if (!common::parse_log_level(config.logging.level)) {
    errors.push_back({"logging.level",
                      "must be one of debug, info, warn, error, off; got \"" + config.logging.level + "\""});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# payengine configuration
# Generated default configuration

[engine]
mode = "serial"  # "serial" | "stream"

[ledger]
withdrawal_disputes = "mirror"  # "mirror" | "reject"

[logging]
level = "warn"  # "debug" | "info" | "warn" | "error" | "off"
)";
}

}  // namespace config
}  // namespace paycore
