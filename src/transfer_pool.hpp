#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Cooperative abort flag shared between a signal handler thread and workers.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
  void reset() { cancelled_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> cancelled_{false};
};

struct TransferTask {
  std::string label;          // reported in the summary, usually the source path
  std::function<void()> run;  // throws on failure
};

struct TransferSummary {
  std::size_t succeeded = 0;
  std::vector<std::pair<std::string, std::string>> failed; // (label, error) in task order
  std::vector<std::string> cancelled;                      // labels never started

  bool ok() const { return failed.empty() && cancelled.empty(); }
  std::size_t total() const { return succeeded + failed.size() + cancelled.size(); }
};

struct PoolConfig {
  std::size_t max_workers = 4;
  std::chrono::milliseconds progress_interval{250};
};

using TransferProgress = std::function<void(std::size_t finished, std::size_t total)>;

// Runs every task on at most max_workers threads and returns once all of them
// have finished or been cancelled. A failing task never stops its siblings,
// except for a SyncError with a credential kind: then no new task starts and
// that error is rethrown once the running tasks have been joined.
// After cancellation no new task starts; tasks already running complete.
// progress is called from worker threads, never with an internal lock held.
TransferSummary run_transfer_tasks(const std::vector<TransferTask>& tasks,
                                   const PoolConfig& config,
                                   const CancellationToken* cancel = nullptr,
                                   const TransferProgress& progress = {});
