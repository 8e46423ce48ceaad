#pragma once

#include "chronicle/common/json_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::llm {

struct ChatMessage {
  std::string role;
  std::string content;

  bool operator==(const ChatMessage &) const = default;
};

struct TokenUsage {
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;

  bool operator==(const TokenUsage &) const = default;
};

/// What a provider client hands back after a successful call.
struct LlmResponse {
  std::string content;
  std::string finish_reason = "stop";
  std::optional<TokenUsage> usage;
  std::string model;
  /// Seconds, as measured by the provider client.
  std::optional<double> response_time;
  common::JsonObject metadata;
  /// Provider's JSON body, used to recover usage when `usage` is unset.
  std::string raw_payload;
};

enum class LlmErrorKind {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  Timeout,
  InvalidResponse,
};

struct LlmError {
  LlmErrorKind kind = LlmErrorKind::ApiError;
  std::string message;
};

[[nodiscard]] std::string to_string(LlmErrorKind kind);

} // namespace chronicle::llm
