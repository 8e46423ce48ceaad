#include "chronicle/history/token_tracker.hpp"

#include "chronicle/common/id.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/observability/global.hpp"

namespace chronicle::history {

namespace {

constexpr const char *COMPONENT = "history.token_tracker";

std::optional<std::uint64_t> count_field(const common::JsonFlatMap &fields,
                                         const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return common::json_parse_u64(it->second);
}

common::JsonFlatMap nested_object(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty() || it->second.front() != '{') {
    return {};
  }
  return common::json_parse_flat(it->second);
}

std::optional<llm::TokenUsage> usage_from_triple(const common::JsonFlatMap &block,
                                                 const std::string &prompt_key,
                                                 const std::string &completion_key,
                                                 const std::string &total_key) {
  const auto prompt = count_field(block, prompt_key);
  if (!prompt.has_value()) {
    return std::nullopt;
  }
  const auto completion = count_field(block, completion_key).value_or(0);
  llm::TokenUsage usage;
  usage.prompt_tokens = *prompt;
  usage.completion_tokens = completion;
  usage.total_tokens = count_field(block, total_key).value_or(*prompt + completion);
  return usage;
}

} // namespace

std::optional<llm::TokenUsage> extract_usage(const std::string &provider_payload) {
  if (!common::json_is_valid_object(provider_payload)) {
    return std::nullopt;
  }
  const auto payload = common::json_parse_flat(provider_payload);

  const auto usage = nested_object(payload, "usage");
  if (usage.contains("prompt_tokens")) {
    return usage_from_triple(usage, "prompt_tokens", "completion_tokens", "total_tokens");
  }

  const auto gemini = nested_object(payload, "usageMetadata");
  if (gemini.contains("promptTokenCount")) {
    return usage_from_triple(gemini, "promptTokenCount", "candidatesTokenCount",
                             "totalTokenCount");
  }

  if (usage.contains("input_tokens")) {
    const auto input = count_field(usage, "input_tokens");
    if (!input.has_value()) {
      return std::nullopt;
    }
    llm::TokenUsage anthropic;
    anthropic.prompt_tokens = *input;
    anthropic.completion_tokens = count_field(usage, "output_tokens").value_or(0);
    anthropic.total_tokens = anthropic.prompt_tokens + anthropic.completion_tokens;
    return anthropic;
  }

  return std::nullopt;
}

TokenUsageTracker::TokenUsageTracker(std::shared_ptr<IHistoryStorage> storage,
                                     std::shared_ptr<llm::ITokenCounter> counter, Clock clock)
    : storage_(std::move(storage)), counter_(std::move(counter)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::now_timestamp;
  }
}

std::uint64_t TokenUsageTracker::estimate_tokens(const std::vector<llm::ChatMessage> &messages) {
  if (counter_ == nullptr) {
    return 0;
  }
  try {
    return counter_->count_messages_tokens(messages).value_or(0);
  } catch (const std::exception &ex) {
    observability::record_error(COMPONENT, std::string("token counter '") +
                                               std::string(counter_->name()) +
                                               "' failed: " + ex.what());
    return 0;
  }
}

TokenUsageRecord TokenUsageTracker::track_request(const std::vector<llm::ChatMessage> &messages,
                                                  const std::string &model,
                                                  const std::string &provider,
                                                  const std::string &session_id) {
  const std::uint64_t estimate = estimate_tokens(messages);

  TokenUsageRecord record;
  record.record_id = common::generate_id();
  record.session_id = session_id;
  record.timestamp = clock_();
  record.model = model;
  record.provider = provider;
  record.prompt_tokens = estimate;
  record.completion_tokens = 0;
  record.total_tokens = estimate;
  record.source = TokenSource::Local;
  record.confidence = kLocalEstimateConfidence;

  if (storage_ != nullptr) {
    (void)storage_->store(record);
  }
  return record;
}

TokenUsageRecord TokenUsageTracker::update_from_response(TokenUsageRecord record,
                                                         const std::string &provider_payload) {
  const auto usage = extract_usage(provider_payload);
  if (!usage.has_value()) {
    observability::record_debug(COMPONENT, "no usage block in response for " + record.record_id);
    return record;
  }

  record.prompt_tokens = usage->prompt_tokens;
  record.completion_tokens = usage->completion_tokens;
  record.total_tokens = usage->total_tokens;
  record.source = TokenSource::Api;
  record.confidence = kApiConfidence;

  if (storage_ != nullptr) {
    (void)storage_->store(record);
  }
  observability::record_metric(observability::TokensUsedMetric{.tokens = record.total_tokens});
  return record;
}

} // namespace chronicle::history
