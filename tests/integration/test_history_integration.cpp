#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "chronicle/config/config.hpp"
#include "chronicle/history/cost_calculator.hpp"
#include "chronicle/history/hook.hpp"
#include "chronicle/history/manager.hpp"
#include "chronicle/history/session_context.hpp"
#include "chronicle/llm/token_counter.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace h = chronicle::history;
namespace l = chronicle::llm;
namespace t = chronicle::testing;

struct Stack {
  std::shared_ptr<h::FileHistoryStorage> storage;
  std::shared_ptr<h::TokenUsageTracker> tracker;
  std::shared_ptr<h::CostCalculator> calculator;
  std::shared_ptr<h::WriteQueue> queue;
  std::shared_ptr<h::HistoryRecordingHook> hook;
  std::unique_ptr<h::HistoryManager> manager;
};

Stack build_stack(const std::filesystem::path &base, const chronicle::config::Config &config) {
  Stack stack;
  stack.storage = std::make_shared<h::FileHistoryStorage>(base);
  stack.tracker = std::make_shared<h::TokenUsageTracker>(
      stack.storage, std::make_shared<l::HeuristicTokenCounter>(config.token_counter));
  stack.calculator = h::create_cost_calculator(config.pricing);
  stack.queue = std::make_shared<h::WriteQueue>(config.history.queue_capacity,
                                                config.history.worker_count);
  stack.hook = std::make_shared<h::HistoryRecordingHook>(
      stack.storage, stack.tracker, stack.calculator, stack.queue,
      h::HookOptions{.pending_ttl = std::chrono::seconds(config.history.pending_ttl_seconds)});
  stack.manager = std::make_unique<h::HistoryManager>(stack.storage);
  return stack;
}

} // namespace

void register_history_integration_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  using chronicle::tests::require_near;

  tests.push_back({"integration_concurrent_sessions_through_hook", [] {
                     t::TempWorkspace ws;
                     const auto parsed = chronicle::config::parse_config(R"(
[history]
queue_capacity = 4096

[pricing]
"openai:gpt-4" = [0.03, 0.06]
)");
                     require(parsed.ok(), parsed.error());
                     auto stack = build_stack(ws.path(), parsed.value());

                     constexpr std::size_t kSessions = 4;
                     constexpr std::size_t kCalls = 10;
                     std::vector<std::thread> threads;
                     for (std::size_t s = 0; s < kSessions; ++s) {
                       threads.emplace_back([&stack, s]() {
                         h::SessionScope scope("session-" + std::to_string(s));
                         for (std::size_t i = 0; i < kCalls; ++i) {
                           const std::vector<l::ChatMessage> messages = {
                               {.role = "user", .content = "question " + std::to_string(i)}};
                           const auto id =
                               stack.hook->before_call(messages, {}, "", "gpt-4", "openai");
                           l::LlmResponse response;
                           response.content = "answer";
                           response.usage = l::TokenUsage{
                               .prompt_tokens = 1000, .completion_tokens = 500, .total_tokens = 1500};
                           if (i % 5 == 4) {
                             stack.hook->on_error(
                                 l::LlmError{.kind = l::LlmErrorKind::RateLimitError,
                                             .message = "slow down"},
                                 messages, {}, id);
                           } else {
                             stack.hook->after_call(response, messages, {}, id);
                           }
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     stack.queue->drain();

                     require(stack.manager->list_sessions().size() == kSessions, "all sessions");
                     for (std::size_t s = 0; s < kSessions; ++s) {
                       const std::string session = "session-" + std::to_string(s);
                       const auto llm = stack.manager->get_llm_statistics(session);
                       require(llm.total_requests == kCalls, "requests per session");
                       require(llm.total_responses == kCalls, "responses per session");
                       require(llm.error_responses == 2, "errors per session");
                       require_near(llm.success_rate, 80.0, "success rate");

                       const auto tokens = stack.manager->get_token_statistics(session);
                       require(tokens.total_requests == 8, "usage per successful call");
                       require(tokens.total_tokens == 8 * 1500, "token sum");

                       const auto cost = stack.manager->get_cost_statistics(session);
                       require(cost.total_requests == 8, "cost per successful call");
                       require_near(cost.total_cost, 8 * (1.0 * 0.03 + 0.5 * 0.06), "cost sum",
                                    1e-9);
                     }
                     require(stack.hook->pending_count() == 0, "no pending left");
                   }});

  tests.push_back({"integration_export_then_cleanup", [] {
                     t::TempWorkspace ws;
                     auto stack = build_stack(ws.path(), chronicle::config::Config{});
                     {
                       h::SessionScope scope("exported");
                       auto old = t::make_message("", "from last year", t::at("2023-01-01T00:00:00Z"));
                       require(stack.manager->record_message(old), "old message");
                       const auto id = stack.hook->before_call({{.role = "user", .content = "hi"}},
                                                               {}, "", "gpt-3.5", "openai");
                       l::LlmResponse response;
                       response.content = "hello";
                       stack.hook->after_call(response, {}, {}, id);
                     }
                     stack.queue->drain();

                     const auto jsonl =
                         stack.manager->export_session("exported", h::ExportFormat::Jsonl);
                     require(jsonl.ok(), jsonl.error());
                     std::size_t lines = 0;
                     for (const char ch : jsonl.value()) {
                       lines += ch == '\n' ? 1 : 0;
                     }
                     require(lines == 5, "message, request, response, usage and cost");

                     const auto cleanup =
                         stack.manager->cleanup(t::at("2024-01-01T00:00:00Z"), false);
                     require(cleanup.cleaned_records == 1, "only last year's message removed");
                     require(stack.manager->query(h::HistoryQuery{.session_id = "exported"}).total ==
                                 4,
                             "call records kept");
                   }});
}
