#include "chronicle/observability/log_observer.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>

namespace chronicle::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : sink_(std::cerr) {}

LogObserver::LogObserver(std::ostream &sink) : sink_(sink) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::ostringstream line;
  line << "[" << level << "] " << message << "\n";
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ << line.str();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, HistoryWriteEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "history.write type=" + evt.record_type + " session=" + evt.session_id +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, LlmCallEvent>) {
          log_line("INFO", "llm.call provider=" + evt.provider + " model=" + evt.model +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, CleanupEvent>) {
          log_line("INFO", "history.cleanup removed=" + std::to_string(evt.removed_records) +
                               " deleted_files=" + std::to_string(evt.deleted_files));
        } else if constexpr (std::is_same_v<T, DebugEvent>) {
          log_line("DEBUG", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line("DEBUG", "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, CostMetric>) {
          std::ostringstream amount;
          amount << m.amount;
          log_line("DEBUG", "metric.cost=" + amount.str() + " " + m.currency);
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, PendingRequestsMetric>) {
          log_line("DEBUG", "metric.pending_requests=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_.flush();
}

} // namespace chronicle::observability
