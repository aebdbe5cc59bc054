#include "paycore/report/csv_snapshot_sink.hpp"

#include <stdexcept>

namespace paycore {
namespace report {

CsvSnapshotSink::CsvSnapshotSink(std::ostream& output) : output_(output) {}

void CsvSnapshotSink::write(const ledger::AccountSnapshot& snapshot) {
  write_header();
  output_ << snapshot.client << ',' << snapshot.available.to_string() << ','
          << snapshot.held.to_string() << ',' << snapshot.total.to_string() << ','
          << (snapshot.locked ? "true" : "false") << '\n';
  if (!output_) {
    throw std::runtime_error("failed to write snapshot row");
  }
}

void CsvSnapshotSink::flush() {
  write_header();
  output_.flush();
  if (!output_) {
    throw std::runtime_error("failed to flush snapshot output");
  }
}

void CsvSnapshotSink::write_header() {
  if (header_written_) {
    return;
  }
  output_ << "client,available,held,total,locked\n";
  header_written_ = true;
}

}  // namespace report
}  // namespace paycore
