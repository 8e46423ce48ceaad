#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "chronicle/config/schema.hpp"
#include "chronicle/observability/factory.hpp"
#include "chronicle/observability/global.hpp"
#include "chronicle/observability/log_observer.hpp"
#include "chronicle/observability/multi_observer.hpp"
#include "chronicle/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public chronicle::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const chronicle::observability::ObserverEvent &) override {
    ++state_->events;
  }
  void record_metric(const chronicle::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  namespace ob = chronicle::observability;
  namespace t = chronicle::testing;

  tests.push_back({"observability_global_without_observer_is_silent", [] {
                     ob::set_global_observer(nullptr);
                     require(ob::get_global_observer() == nullptr, "no observer");
                     ob::record_history_write("message", "s", true);
                     ob::record_metric(ob::TokensUsedMetric{.tokens = 1});
                   }});

  tests.push_back({"observability_global_dispatches_helpers", [] {
                     t::ObserverGuard guard;
                     ob::record_history_write("message", "s1", false);
                     ob::record_llm_call("openai", "gpt-4", std::chrono::milliseconds(12), true);
                     ob::record_cleanup(5, 1);
                     ob::record_debug("test", "hello");
                     ob::record_error("test", "broken");
                     ob::record_metric(ob::CostMetric{.amount = 0.04, .currency = "USD"});

                     const auto events = guard.capture().events();
                     require(events.size() == 5, "five events");
                     const auto &write = std::get<ob::HistoryWriteEvent>(events[0]);
                     require(write.record_type == "message" && !write.success, "write event");
                     require(std::get<ob::LlmCallEvent>(events[1]).duration.count() == 12,
                             "llm call duration");
                     require(std::get<ob::CleanupEvent>(events[2]).removed_records == 5,
                             "cleanup event");
                     require(guard.capture().errors().size() == 1, "one error");
                     require(guard.capture().metrics().size() == 1, "one metric");
                   }});

  tests.push_back({"observability_replacing_observer_flushes_previous", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_debug("x", "y");
                     ob::set_global_observer(nullptr);
                     require(state.events == 1, "event delivered");
                     require(state.flushes == 1, "flushed on replacement");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));
                     multi->add(nullptr);
                     require(multi->size() == 2, "null child ignored");

                     multi->record_event(ob::DebugEvent{.component = "a", .message = "b"});
                     multi->record_metric(ob::QueueDepthMetric{.depth = 3});
                     multi->flush();
                     require(one.events == 1 && two.events == 1, "events forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metrics forwarded");
                     require(one.flushes == 1 && two.flushes == 1, "flush forwarded");
                   }});

  tests.push_back({"observability_log_observer_writes_levelled_lines", [] {
                     std::ostringstream sink;
                     ob::LogObserver observer(sink);
                     observer.record_event(ob::HistoryWriteEvent{
                         .record_type = "cost", .session_id = "s9", .success = false});
                     observer.record_event(ob::ErrorEvent{.component = "history.storage",
                                                          .message = "disk full"});
                     observer.record_metric(ob::PendingRequestsMetric{.count = 2});
                     observer.flush();

                     const std::string out = sink.str();
                     require(out.find("[WARN] history.write type=cost session=s9 success=false\n") !=
                                 std::string::npos,
                             "failed write logged at WARN");
                     require(out.find("[ERROR] history.storage: disk full\n") != std::string::npos,
                             "error line");
                     require(out.find("[DEBUG] metric.pending_requests=2\n") != std::string::npos,
                             "metric line");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     const auto make = [](const std::string &backend) {
                       return ob::create_observer(chronicle::config::ObservabilityConfig{.backend = backend});
                     };
                     require(make("none")->name() == "noop", "none");
                     require(make("noop")->name() == "noop", "noop");
                     require(make("")->name() == "noop", "empty");
                     require(make("log")->name() == "log", "log");
                     require(make(" LOG ")->name() == "log", "normalised");
                     require(make("log,noop")->name() == "multi", "comma list");
                     require(make("statsd")->name() == "log", "unknown falls back to log");
                   }});

  tests.push_back({"observability_noop_accepts_everything", [] {
                     ob::NoopObserver observer;
                     observer.record_event(ob::CleanupEvent{});
                     observer.record_metric(ob::TokensUsedMetric{});
                     observer.flush();
                     require(observer.name() == "noop", "name");
                   }});
}
