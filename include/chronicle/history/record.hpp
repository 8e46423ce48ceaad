#pragma once

#include "chronicle/common/json_util.hpp"
#include "chronicle/common/result.hpp"
#include "chronicle/common/time.hpp"
#include "chronicle/llm/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace chronicle::history {

/// Open key/value map. Values that are not JSON strings (numbers, literals,
/// arrays, objects) are held as raw JSON and written back unquoted.
using Metadata = common::JsonObject;

/// One persisted line, top-level keys only.
using RawRecord = common::JsonFlatMap;

enum class MessageType {
  User,
  Assistant,
  System,
};

enum class TokenSource {
  Local,
  Api,
  Hybrid,
};

[[nodiscard]] std::string message_type_to_string(MessageType type);
[[nodiscard]] MessageType message_type_from_string(std::string_view value);
[[nodiscard]] std::string token_source_to_string(TokenSource source);
[[nodiscard]] TokenSource token_source_from_string(std::string_view value);

struct MessageRecord {
  static constexpr std::string_view kType = "message";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  MessageType message_type = MessageType::User;
  std::string content;
  Metadata metadata;

  bool operator==(const MessageRecord &) const = default;
};

struct ToolCallRecord {
  static constexpr std::string_view kType = "tool_call";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string tool_name;
  Metadata tool_input;
  std::optional<Metadata> tool_output;
  Metadata metadata;

  bool operator==(const ToolCallRecord &) const = default;
};

struct LlmRequestRecord {
  static constexpr std::string_view kType = "llm_request";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string model;
  std::string provider;
  std::vector<llm::ChatMessage> messages;
  Metadata parameters;
  std::optional<std::uint64_t> estimated_tokens;
  Metadata metadata;

  bool operator==(const LlmRequestRecord &) const = default;
};

struct LlmResponseRecord {
  static constexpr std::string_view kType = "llm_response";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string request_id;
  std::string content;
  std::string finish_reason;
  llm::TokenUsage token_usage;
  /// Seconds.
  double response_time = 0.0;
  std::string model;
  Metadata metadata;

  bool operator==(const LlmResponseRecord &) const = default;
};

struct TokenUsageRecord {
  static constexpr std::string_view kType = "token_usage";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string model;
  std::string provider;
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;
  TokenSource source = TokenSource::Local;
  double confidence = 1.0;
  Metadata metadata;

  bool operator==(const TokenUsageRecord &) const = default;
};

struct CostRecord {
  static constexpr std::string_view kType = "cost";

  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string model;
  std::string provider;
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;
  double prompt_cost = 0.0;
  double completion_cost = 0.0;
  double total_cost = 0.0;
  std::string currency = "USD";
  Metadata metadata;

  bool operator==(const CostRecord &) const = default;
};

using HistoryRecord = std::variant<MessageRecord, ToolCallRecord, LlmRequestRecord,
                                   LlmResponseRecord, TokenUsageRecord, CostRecord>;

[[nodiscard]] std::string_view record_type_of(const HistoryRecord &record);
[[nodiscard]] const std::string &record_id_of(const HistoryRecord &record);
[[nodiscard]] const std::string &session_id_of(const HistoryRecord &record);
[[nodiscard]] common::Timestamp timestamp_of(const HistoryRecord &record);

struct RecordHeader {
  std::string record_id;
  std::string session_id;
  common::Timestamp timestamp{};
  std::string_view record_type;
};

[[nodiscard]] RecordHeader record_header(const HistoryRecord &record);

/// Fills record_id, session_id and timestamp where they are empty.
void fill_header(HistoryRecord &record, const std::string &session_id,
                 common::Timestamp timestamp);

[[nodiscard]] common::Status validate_record(const HistoryRecord &record);

/// Canonical single-line JSON form. Enums are rendered as their stable strings,
/// timestamps as ISO-8601.
[[nodiscard]] std::string encode_record_json(const HistoryRecord &record);

/// Discriminator-driven reconstruction. Missing optional fields take their
/// defaults; an unknown record_type is a failure.
[[nodiscard]] common::Result<HistoryRecord> record_from_raw(const RawRecord &raw);
[[nodiscard]] common::Result<HistoryRecord> parse_record_json(const std::string &line);

} // namespace chronicle::history
