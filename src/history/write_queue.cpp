#include "chronicle/history/write_queue.hpp"

#include "chronicle/observability/global.hpp"

#include <algorithm>

namespace chronicle::history {

namespace {

constexpr const char *COMPONENT = "history.write_queue";

} // namespace

WriteQueue::WriteQueue(const std::size_t capacity, const std::size_t worker_count)
    : capacity_(std::max<std::size_t>(1, capacity)) {
  running_ = true;
  const std::size_t workers = std::max<std::size_t>(1, worker_count);
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this]() { run_worker(); });
  }
}

WriteQueue::~WriteQueue() { stop(); }

bool WriteQueue::submit(Job job, const std::string &label) {
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || jobs_.size() >= capacity_) {
      ++dropped_;
      const std::string reason = running_ ? "queue full" : "queue stopped";
      observability::record_error(COMPONENT, "dropped " + label + ": " + reason);
      return false;
    }
    jobs_.push_back(std::move(job));
    depth = jobs_.size();
  }
  work_cv_.notify_one();
  observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  return true;
}

void WriteQueue::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return jobs_.empty() && active_ == 0; });
}

void WriteQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && workers_.empty()) {
      return;
    }
    running_ = false;
  }
  work_cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

std::size_t WriteQueue::depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

void WriteQueue::run_worker() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return !jobs_.empty() || !running_; });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
      ++active_;
    }

    try {
      job();
    } catch (const std::exception &ex) {
      observability::record_error(COMPONENT, std::string("job failed: ") + ex.what());
    } catch (...) {
      observability::record_error(COMPONENT, "job failed with a non-standard exception");
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (jobs_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

} // namespace chronicle::history
