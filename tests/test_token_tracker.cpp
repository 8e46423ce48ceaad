#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "chronicle/history/record.hpp"
#include "chronicle/history/storage.hpp"
#include "chronicle/history/token_tracker.hpp"
#include "chronicle/llm/token_counter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

namespace h = chronicle::history;
namespace l = chronicle::llm;
namespace t = chronicle::testing;

std::vector<l::ChatMessage> conversation() {
  return {{.role = "system", .content = "You are terse."},
          {.role = "user", .content = "What is the capital of France?"}};
}

std::vector<h::TokenUsageRecord> stored_usage(h::IHistoryStorage &storage,
                                              const std::string &session) {
  std::vector<h::TokenUsageRecord> out;
  for (const auto &raw : storage.read_all(session)) {
    auto parsed = h::record_from_raw(raw);
    if (parsed.ok() && std::holds_alternative<h::TokenUsageRecord>(parsed.value())) {
      out.push_back(std::get<h::TokenUsageRecord>(parsed.value()));
    }
  }
  return out;
}

} // namespace

void register_token_tracker_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  using chronicle::tests::require_near;

  tests.push_back({"heuristic_counter_counts_characters_and_overheads", [] {
                     l::HeuristicTokenCounter counter;
                     require(counter.count_text_tokens("") == 0, "empty text");
                     require(counter.count_text_tokens("hi") == 2, "short text counts two");
                     require(counter.count_text_tokens("abcd") == 2, "one-token text counts two");
                     require(counter.count_text_tokens(std::string(40, 'a')) == 10, "40 chars");
                     require(counter.count_text_tokens(std::string(43, 'a')) == 10,
                             "floor division");

                     // reply overhead 3, plus (content + 4) per message
                     const std::vector<l::ChatMessage> messages = {
                         {.role = "user", .content = std::string(40, 'a')},
                         {.role = "assistant", .content = ""}};
                     require(counter.count_messages_tokens(messages) ==
                                 std::optional<std::uint64_t>(3 + 14 + 4),
                             "message total");
                     require(counter.count_messages_tokens({}) == std::optional<std::uint64_t>(3),
                             "reply overhead only");
                   }});

  tests.push_back({"heuristic_counter_honours_configuration", [] {
                     chronicle::config::TokenCounterConfig config;
                     config.chars_per_token = 2;
                     config.message_overhead = 0;
                     config.reply_overhead = 0;
                     l::HeuristicTokenCounter counter(config);
                     require(counter.count_messages_tokens({{.role = "user", .content = "abcdef"}}) ==
                                 std::optional<std::uint64_t>(3),
                             "six chars at two per token");
                   }});

  tests.push_back({"tracker_track_request_persists_local_estimate", [] {
                     t::TempWorkspace ws;
                     auto storage = std::make_shared<h::FileHistoryStorage>(ws.path());
                     auto counter = std::make_shared<t::FixedTokenCounter>(42);
                     h::TokenUsageTracker tracker(storage, counter);

                     const auto record = tracker.track_request(conversation(), "gpt-4", "openai", "s1");
                     require(record.prompt_tokens == 42 && record.total_tokens == 42, "estimate");
                     require(record.completion_tokens == 0, "no completion estimate");
                     require(record.source == h::TokenSource::Local, "local source");
                     require_near(record.confidence, h::kLocalEstimateConfidence, "confidence");

                     const auto stored = stored_usage(*storage, "s1");
                     require(stored.size() == 1, "one usage line");
                     require(stored[0] == record, "persisted record matches");
                   }});

  tests.push_back({"tracker_reconciles_openai_usage", [] {
                     t::TempWorkspace ws;
                     t::ObserverGuard guard;
                     auto storage = std::make_shared<h::FileHistoryStorage>(ws.path());
                     h::TokenUsageTracker tracker(storage, std::make_shared<t::FixedTokenCounter>(12));

                     const auto local = tracker.track_request(conversation(), "gpt-4", "openai", "s1");
                     const auto updated = tracker.update_from_response(
                         local,
                         R"({"id":"x","usage":{"prompt_tokens":15,"completion_tokens":25,"total_tokens":40}})");
                     require(updated.prompt_tokens == 15, "prompt");
                     require(updated.completion_tokens == 25, "completion");
                     require(updated.total_tokens == 40, "total");
                     require(updated.source == h::TokenSource::Api, "api source");
                     require_near(updated.confidence, 1.0, "api confidence");
                     require(updated.record_id == local.record_id, "same record id");

                     const auto stored = stored_usage(*storage, "s1");
                     require(stored.size() == 2, "estimate and reconciliation both persisted");
                     require(stored[0].record_id == stored[1].record_id, "shared record id");
                     require(stored[1].source == h::TokenSource::Api, "latest line is api");

                     bool saw_metric = false;
                     for (const auto &metric : guard.capture().metrics()) {
                       if (const auto *tokens =
                               std::get_if<chronicle::observability::TokensUsedMetric>(&metric);
                           tokens != nullptr && tokens->tokens == 40) {
                         saw_metric = true;
                       }
                     }
                     require(saw_metric, "tokens metric expected");
                   }});

  tests.push_back({"tracker_ignores_payload_without_usage", [] {
                     t::TempWorkspace ws;
                     auto storage = std::make_shared<h::FileHistoryStorage>(ws.path());
                     h::TokenUsageTracker tracker(storage, std::make_shared<t::FixedTokenCounter>(9));
                     const auto local = tracker.track_request(conversation(), "m", "p", "s1");

                     require(tracker.update_from_response(local, R"({"choices":[]})") == local,
                             "unchanged without usage");
                     require(tracker.update_from_response(local, "not json") == local,
                             "unchanged on garbage");
                     require(stored_usage(*storage, "s1").size() == 1, "nothing else written");
                   }});

  tests.push_back({"extract_usage_recognises_provider_shapes", [] {
                     const auto openai = h::extract_usage(
                         R"({"usage":{"prompt_tokens":10,"completion_tokens":5}})");
                     require(openai.has_value() && openai->total_tokens == 15,
                             "missing total is derived");

                     const auto gemini = h::extract_usage(
                         R"({"usageMetadata":{"promptTokenCount":7,"candidatesTokenCount":3,"totalTokenCount":11}})");
                     require(gemini.has_value(), "gemini shape");
                     require(gemini->prompt_tokens == 7 && gemini->completion_tokens == 3 &&
                                 gemini->total_tokens == 11,
                             "gemini counts");

                     const auto anthropic = h::extract_usage(
                         R"({"usage":{"input_tokens":20,"output_tokens":8}})");
                     require(anthropic.has_value(), "anthropic shape");
                     require(anthropic->prompt_tokens == 20 && anthropic->completion_tokens == 8 &&
                                 anthropic->total_tokens == 28,
                             "anthropic total is the sum");

                     require(!h::extract_usage(R"({"usage":{}})").has_value(), "empty usage");
                     require(!h::extract_usage("").has_value(), "empty payload");
                     require(!h::extract_usage(
                                  R"({"usage":{"prompt_tokens":1e30,"completion_tokens":5}})")
                                  .has_value(),
                             "counts beyond 64 bits are rejected");
                   }});

  tests.push_back({"tracker_estimate_never_throws", [] {
                     t::ObserverGuard guard;
                     h::TokenUsageTracker failing(nullptr, std::make_shared<t::ThrowingTokenCounter>());
                     require(failing.estimate_tokens(conversation()) == 0, "throwing counts zero");
                     require(!guard.capture().errors().empty(), "failure logged");

                     h::TokenUsageTracker unknown(nullptr, std::make_shared<t::FixedTokenCounter>(std::nullopt));
                     require(unknown.estimate_tokens(conversation()) == 0, "unknown counts zero");

                     h::TokenUsageTracker none(nullptr, nullptr);
                     require(none.estimate_tokens(conversation()) == 0, "no counter counts zero");
                   }});
}
