#include "chronicle/observability/global.hpp"

#include <mutex>

namespace chronicle::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

// Callers keep their own reference so a concurrent set_global_observer cannot
// destroy the observer mid-call.
std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_history_write(const std::string &record_type, const std::string &session_id,
                          const bool success) {
  record_event(HistoryWriteEvent{
      .record_type = record_type, .session_id = session_id, .success = success});
}

void record_llm_call(const std::string &provider, const std::string &model,
                     const std::chrono::milliseconds duration, const bool success) {
  record_event(LlmCallEvent{
      .provider = provider, .model = model, .duration = duration, .success = success});
}

void record_cleanup(const std::uint64_t removed_records, const std::uint64_t deleted_files) {
  record_event(CleanupEvent{.removed_records = removed_records, .deleted_files = deleted_files});
}

void record_debug(const std::string &component, const std::string &message) {
  record_event(DebugEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace chronicle::observability
