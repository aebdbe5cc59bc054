#pragma once

namespace paycore::tests {

void test_csv_snapshot_sink();
void test_csv_snapshot_sink_empty();

}  // namespace paycore::tests
