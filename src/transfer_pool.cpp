#include "transfer_pool.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace {

enum class TaskState : uint8_t { Pending, Running, Succeeded, Failed };

} // namespace

TransferSummary run_transfer_tasks(const std::vector<TransferTask>& tasks,
                                   const PoolConfig& config,
                                   const CancellationToken* cancel,
                                   const TransferProgress& progress) {
  TransferSummary summary;
  if(tasks.empty()) return summary;

  const std::size_t total = tasks.size();
  const std::size_t worker_count = std::min(std::max<std::size_t>(1, config.max_workers), total);

  std::vector<TaskState> states(total, TaskState::Pending);
  std::vector<std::string> errors(total);

  std::mutex job_mutex;
  std::deque<std::size_t> job_queue;
  for(std::size_t i = 0; i < total; ++i) job_queue.push_back(i);
  std::size_t finished = 0;
  std::exception_ptr fatal;

  auto cancelled = [&]{ return cancel && cancel->cancelled(); };

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(fatal || cancelled() || job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    states[job] = TaskState::Running;
    return job;
  };

  std::mutex progress_mutex;
  auto last_report = std::chrono::steady_clock::now();
  auto report = [&](std::size_t done, bool force){
    if(!progress) return;
    {
      std::lock_guard<std::mutex> lock(progress_mutex);
      auto now = std::chrono::steady_clock::now();
      if(!force && now - last_report < config.progress_interval) return;
      last_report = now;
    }
    progress(done, total);
  };

  auto worker_fn = [&](){
    while(true) {
      auto job_opt = take_job();
      if(!job_opt) break;
      const std::size_t job = *job_opt;
      TaskState outcome = TaskState::Succeeded;
      std::string error;
      std::exception_ptr abort_with;
      try {
        if(!tasks[job].run) throw std::runtime_error("task has nothing to run");
        tasks[job].run();
      } catch(const SyncError& e) {
        outcome = TaskState::Failed;
        error = e.what();
        if(is_credential_failure(e.kind())) abort_with = std::current_exception();
      } catch(const std::exception& e) {
        outcome = TaskState::Failed;
        error = e.what();
      } catch(...) {
        outcome = TaskState::Failed;
        error = "unknown error";
      }
      std::size_t done = 0;
      {
        std::lock_guard<std::mutex> lock(job_mutex);
        states[job] = outcome;
        errors[job] = std::move(error);
        done = ++finished;
        if(abort_with && !fatal) fatal = abort_with;
      }
      report(done, done == total);
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }
  if(fatal) std::rethrow_exception(fatal);

  for(std::size_t i = 0; i < total; ++i) {
    switch(states[i]) {
      case TaskState::Succeeded:
        ++summary.succeeded;
        break;
      case TaskState::Failed:
        summary.failed.emplace_back(tasks[i].label, errors[i]);
        break;
      case TaskState::Pending:
      case TaskState::Running:
        summary.cancelled.push_back(tasks[i].label);
        break;
    }
  }
  return summary;
}
