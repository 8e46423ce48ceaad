#pragma once

#include "chronicle/observability/observer.hpp"

#include <memory>

namespace chronicle::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_history_write(const std::string &record_type, const std::string &session_id,
                          bool success);
void record_llm_call(const std::string &provider, const std::string &model,
                     std::chrono::milliseconds duration, bool success);
void record_cleanup(std::uint64_t removed_records, std::uint64_t deleted_files);
void record_debug(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace chronicle::observability
