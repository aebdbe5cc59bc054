#pragma once

#include <ostream>

#include "paycore/engine/pipeline.hpp"
#include "paycore/ledger/account_ledger.hpp"

namespace paycore {
namespace report {

// Writes `client,available,held,total,locked` rows. The header is emitted
// before the first row, or on flush() when there are no rows.
class CsvSnapshotSink final : public engine::SnapshotSink {
 public:
  explicit CsvSnapshotSink(std::ostream& output);

  void write(const ledger::AccountSnapshot& snapshot) override;
  void flush() override;

 private:
  void write_header();

  std::ostream& output_;
  bool header_written_{false};
};

}  // namespace report
}  // namespace paycore
