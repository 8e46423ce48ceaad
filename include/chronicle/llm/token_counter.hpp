#pragma once

#include "chronicle/config/schema.hpp"
#include "chronicle/llm/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::llm {

class ITokenCounter {
public:
  virtual ~ITokenCounter() = default;

  /// nullopt when the counter cannot estimate for these messages.
  [[nodiscard]] virtual std::optional<std::uint64_t>
  count_messages_tokens(const std::vector<ChatMessage> &messages) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Character-ratio estimate: chars / chars_per_token per content, 2 for any
/// non-empty content no longer than one token, plus per-message and per-reply
/// overheads.
class HeuristicTokenCounter final : public ITokenCounter {
public:
  HeuristicTokenCounter() = default;
  explicit HeuristicTokenCounter(const config::TokenCounterConfig &config);

  [[nodiscard]] std::optional<std::uint64_t>
  count_messages_tokens(const std::vector<ChatMessage> &messages) override;
  [[nodiscard]] std::string_view name() const override { return "heuristic"; }

  [[nodiscard]] std::uint64_t count_text_tokens(std::string_view text) const;

private:
  config::TokenCounterConfig config_;
};

} // namespace chronicle::llm
