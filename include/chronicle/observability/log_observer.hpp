#pragma once

#include "chronicle/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace chronicle::observability {

/// One "[LEVEL] message" line per event; metrics are logged at DEBUG.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &sink);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &sink_;
  std::mutex mutex_;
};

} // namespace chronicle::observability
