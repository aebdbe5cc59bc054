#include "test_common.hpp"

#include <cassert>
#include <thread>
#include <vector>
#include "paycore/common/channel.hpp"
#include "paycore/common/log.hpp"

namespace paycore::tests {

void test_channel_order() {
  common::Channel<int> channel;
  std::vector<int> received;
  std::thread consumer([&] {
    int value = 0;
    while (channel.pop(value)) {
      received.push_back(value);
    }
  });

  for (int value = 0; value < 10'000; ++value) {
    assert(channel.push(value));
  }
  channel.close();
  consumer.join();

  assert(received.size() == 10'000);
  for (int value = 0; value < 10'000; ++value) {
    assert(received[static_cast<std::size_t>(value)] == value);
  }

  assert(channel.closed());
  assert(!channel.push(1));
  int out = 0;
  assert(!channel.pop(out));
}

void test_channel_drains_after_close() {
  common::Channel<int> channel;
  assert(channel.push(1));
  assert(channel.push(2));
  channel.close();
  assert(channel.size() == 2);

  int out = 0;
  assert(channel.pop(out) && out == 1);
  assert(channel.pop(out) && out == 2);
  assert(!channel.pop(out));
}

void test_log_levels() {
  const auto saved = common::log_level();

  assert(common::parse_log_level("info") == common::LogLevel::kInfo);
  assert(common::parse_log_level("off") == common::LogLevel::kOff);
  assert(!common::parse_log_level("trace"));

  common::set_log_level(common::LogLevel::kWarn);
  assert(!common::log_enabled(common::LogLevel::kInfo));
  assert(common::log_enabled(common::LogLevel::kWarn));
  assert(common::log_enabled(common::LogLevel::kError));

  common::set_log_level(common::LogLevel::kOff);
  assert(!common::log_enabled(common::LogLevel::kError));
  assert(!common::log_enabled(common::LogLevel::kOff));

  common::set_log_level(saved);
}

}  // namespace paycore::tests
