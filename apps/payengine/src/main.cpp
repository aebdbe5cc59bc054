#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include "paycore/common/amount.hpp"
#include "paycore/common/log.hpp"
#include "paycore/config/config_loader.hpp"
#include "paycore/engine/engine.hpp"
#include "paycore/engine/pipeline.hpp"
#include "paycore/ingest/csv_transaction_source.hpp"
#include "paycore/ledger/ledger_store.hpp"
#include "paycore/report/csv_snapshot_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv>\n"
            << "  Configuration is read from $PAYENGINE_CONFIG, ./payengine.toml,\n"
            << "  /etc/payengine/payengine.toml or ~/.config/payengine/payengine.toml\n";
}

std::filesystem::path find_config_path() {
  if (const char* env = std::getenv("PAYENGINE_CONFIG"); env != nullptr && *env != '\0') {
    return std::filesystem::path{env};
  }

  std::filesystem::path default_paths[] = {
      "./payengine.toml",
      "/etc/payengine/payengine.toml",
      std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""} / ".config/payengine/payengine.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(paycore::config::EngineConfig& cfg) {
  using paycore::config::ConfigLoader;

  const auto config_path = find_config_path();
  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }

  cfg = std::move(result.config);
  paycore::common::set_log_level(cfg.log_level());
  if (config_path.empty()) {
    paycore::common::log_info("no config file found, using defaults");
  } else {
    paycore::common::log_info("config loaded from " + config_path.string());
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }

  config::EngineConfig cfg;
  if (!load_config(cfg)) {
    return 1;
  }

  std::ifstream input(argv[1]);
  if (!input) {
    common::log_error(std::string("cannot open input file: ") + argv[1]);
    return 1;
  }

  ledger::LedgerStore store{cfg.withdrawal_dispute_policy()};
  auto processor = engine::make_engine(cfg.engine_mode(), store);
  common::log_info(std::string("engine: ") + std::string(engine::to_string(cfg.engine_mode())) +
                   ", withdrawal disputes: " + std::string(ledger::to_string(store.policy())));

  try {
    ingest::CsvTransactionSource source{input};
    const auto read = engine::run(source, *processor);

    report::CsvSnapshotSink sink{std::cout};
    engine::emit(store, sink);

    const auto stats = processor->stats();
    common::log_info("read " + std::to_string(read) + " records, applied " +
                     std::to_string(stats.applied) + ", dropped " + std::to_string(stats.dropped) +
                     ", clients " + std::to_string(store.size()));
  } catch (const common::ParseError& err) {
    common::log_error(std::string("parse error (") + std::string(common::to_string(err.code())) +
                      "): " + err.what());
    return 1;
  } catch (const common::ArithmeticOverflow& err) {
    common::log_error(std::string("arithmetic overflow: ") + err.what());
    return 1;
  } catch (const std::exception& err) {
    common::log_error(err.what());
    return 1;
  }

  return 0;
}
