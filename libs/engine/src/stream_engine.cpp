#include "paycore/engine/stream_engine.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

#include "paycore/common/channel.hpp"
#include "paycore/common/log.hpp"

namespace paycore {
namespace engine {

class StreamEngine::Worker {
 public:
  explicit Worker(ledger::AccountLedger& account)
      : account_(account), thread_([this] { run(); }) {}

  ~Worker() { join(); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // False once the worker has been joined.
  [[nodiscard]] bool submit(const ledger::TransactionRecord& record) { return channel_.push(record); }

  void join() {
    channel_.close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  // Valid after join().
  [[nodiscard]] const EngineStats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::exception_ptr failure() const noexcept { return failure_; }

 private:
  void run() {
    ledger::TransactionRecord record;
    while (channel_.pop(record)) {
      if (failure_) {
        continue;  // drain without applying
      }
      try {
        stats_.record(apply_logged(account_, record));
      } catch (const std::exception& ex) {
        common::log_error("[client " + std::to_string(account_.client()) +
                          "] worker stopped: " + ex.what());
        failure_ = std::current_exception();
      }
    }
  }

  ledger::AccountLedger& account_;
  common::Channel<ledger::TransactionRecord> channel_{};
  EngineStats stats_{};
  std::exception_ptr failure_{};
  std::thread thread_;
};

StreamEngine::StreamEngine(ledger::LedgerStore& store) : store_(store) {}

StreamEngine::~StreamEngine() {
  for (auto& [client, worker] : workers_) {
    worker->join();
  }
}

void StreamEngine::process(const ledger::TransactionRecord& record) {
  if (finished_) {
    throw std::runtime_error("stream engine already finished");
  }

  auto it = workers_.find(record.client);
  if (it == workers_.end()) {
    common::log_debug("[client " + std::to_string(record.client) + "] spawning worker");
    auto& account = store_.get_or_create(record.client);
    it = workers_.emplace(record.client, std::make_unique<Worker>(account)).first;
  }
  if (!it->second->submit(record)) {
    throw std::runtime_error("worker for client " + std::to_string(record.client) +
                             " no longer accepts records");
  }
}

void StreamEngine::finish() {
  if (finished_) {
    return;
  }
  finished_ = true;

  for (auto& [client, worker] : workers_) {
    worker->join();
  }

  std::exception_ptr first_failure;
  for (const auto& [client, worker] : workers_) {
    stats_.merge(worker->stats());
    if (!first_failure && worker->failure()) {
      first_failure = worker->failure();
    }
  }

  if (first_failure) {
    std::rethrow_exception(first_failure);
  }
}

}  // namespace engine
}  // namespace paycore
