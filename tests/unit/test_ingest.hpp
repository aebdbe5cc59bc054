#pragma once

namespace paycore::tests {

void test_decode_row();
void test_decode_row_rejects();
void test_csv_transaction_source();
void test_csv_transaction_source_errors();

}  // namespace paycore::tests
