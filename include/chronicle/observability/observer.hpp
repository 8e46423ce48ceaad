#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace chronicle::observability {

struct HistoryWriteEvent {
  std::string record_type;
  std::string session_id;
  bool success = false;
};

struct LlmCallEvent {
  std::string provider;
  std::string model;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct CleanupEvent {
  std::uint64_t removed_records = 0;
  std::uint64_t deleted_files = 0;
};

struct DebugEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<HistoryWriteEvent, LlmCallEvent, CleanupEvent, DebugEvent, ErrorEvent>;

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct CostMetric {
  double amount = 0.0;
  std::string currency = "USD";
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct PendingRequestsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<TokensUsedMetric, CostMetric, QueueDepthMetric, PendingRequestsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace chronicle::observability
