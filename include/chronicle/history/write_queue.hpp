#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chronicle::history {

/// Bounded FIFO of telemetry jobs run on background workers. submit() never
/// blocks the caller: a full or stopped queue drops the job.
class WriteQueue {
public:
  using Job = std::function<void()>;

  explicit WriteQueue(std::size_t capacity = 1024, std::size_t worker_count = 1);
  ~WriteQueue();

  WriteQueue(const WriteQueue &) = delete;
  WriteQueue &operator=(const WriteQueue &) = delete;

  /// False when the job was dropped. `label` names it in the drop log.
  bool submit(Job job, const std::string &label = "job");

  /// Blocks until nothing is queued or running.
  void drain();
  /// Runs what is already queued, then joins the workers. Idempotent.
  void stop();

  [[nodiscard]] std::size_t depth() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t dropped() const { return dropped_; }
  [[nodiscard]] bool is_running() const { return running_; }

private:
  void run_worker();

  std::size_t capacity_;
  std::deque<Job> jobs_;
  std::vector<std::thread> workers_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::size_t active_ = 0;
  std::atomic<std::size_t> dropped_{0};
  std::atomic<bool> running_{false};
};

} // namespace chronicle::history
