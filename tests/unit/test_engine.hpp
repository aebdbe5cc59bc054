#pragma once

namespace paycore::tests {

void test_serial_engine();
void test_stream_engine();
void test_engines_equivalent();
void test_stream_engine_overflow();
void test_stream_engine_total_overflow();
void test_serial_engine_overflow();
void test_pipeline_emit();

}  // namespace paycore::tests
