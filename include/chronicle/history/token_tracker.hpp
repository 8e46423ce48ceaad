#pragma once

#include "chronicle/history/record.hpp"
#include "chronicle/history/storage.hpp"
#include "chronicle/llm/token_counter.hpp"
#include "chronicle/llm/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::history {

inline constexpr double kLocalEstimateConfidence = 0.7;
inline constexpr double kApiConfidence = 1.0;

/// Records a local token estimate before a call and reconciles it with the
/// provider's reported usage afterwards.
class TokenUsageTracker {
public:
  TokenUsageTracker(std::shared_ptr<IHistoryStorage> storage,
                    std::shared_ptr<llm::ITokenCounter> counter, Clock clock = common::now_timestamp);

  /// Persists a `local` record (confidence 0.7, no completion tokens) and returns it.
  TokenUsageRecord track_request(const std::vector<llm::ChatMessage> &messages,
                                 const std::string &model, const std::string &provider,
                                 const std::string &session_id);

  /// When `provider_payload` carries a recognised usage block, overwrites the token
  /// counts, marks the record `api` with confidence 1.0 and appends it again under
  /// the same record_id. Otherwise the record comes back unchanged and nothing is
  /// written.
  TokenUsageRecord update_from_response(TokenUsageRecord record,
                                        const std::string &provider_payload);

  /// Never throws. An unknown estimate or a failing counter counts as zero.
  [[nodiscard]] std::uint64_t estimate_tokens(const std::vector<llm::ChatMessage> &messages);

private:
  std::shared_ptr<IHistoryStorage> storage_;
  std::shared_ptr<llm::ITokenCounter> counter_;
  Clock clock_;
};

/// Usage from a raw provider body, tried in order: OpenAI `usage.prompt_tokens`,
/// Gemini `usageMetadata.promptTokenCount`, Anthropic `usage.input_tokens`.
[[nodiscard]] std::optional<llm::TokenUsage> extract_usage(const std::string &provider_payload);

} // namespace chronicle::history
