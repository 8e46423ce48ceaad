#include "chronicle/llm/types.hpp"

namespace chronicle::llm {

std::string to_string(const LlmErrorKind kind) {
  switch (kind) {
  case LlmErrorKind::ApiError:
    return "api_error";
  case LlmErrorKind::NetworkError:
    return "network_error";
  case LlmErrorKind::AuthError:
    return "auth_error";
  case LlmErrorKind::RateLimitError:
    return "rate_limit_error";
  case LlmErrorKind::Timeout:
    return "timeout";
  case LlmErrorKind::InvalidResponse:
    return "invalid_response";
  }
  return "api_error";
}

} // namespace chronicle::llm
