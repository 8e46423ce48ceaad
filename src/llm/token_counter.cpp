#include "chronicle/llm/token_counter.hpp"

namespace chronicle::llm {

HeuristicTokenCounter::HeuristicTokenCounter(const config::TokenCounterConfig &config)
    : config_(config) {
  if (config_.chars_per_token == 0) {
    config_.chars_per_token = 1;
  }
}

std::uint64_t HeuristicTokenCounter::count_text_tokens(const std::string_view text) const {
  if (text.empty()) {
    return 0;
  }
  const std::uint64_t per = config_.chars_per_token;
  if (text.size() <= per) {
    return 2;
  }
  return text.size() / per;
}

std::optional<std::uint64_t>
HeuristicTokenCounter::count_messages_tokens(const std::vector<ChatMessage> &messages) {
  std::uint64_t total = config_.reply_overhead;
  for (const auto &message : messages) {
    total += count_text_tokens(message.content) + config_.message_overhead;
  }
  return total;
}

} // namespace chronicle::llm
