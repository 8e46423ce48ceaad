#include "chronicle/history/record.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/id.hpp"

#include <algorithm>
#include <type_traits>

namespace chronicle::history {

namespace {

class JsonObjectWriter {
public:
  void string(const std::string &key, const std::string &value) {
    raw(key, common::json_quote(value));
  }

  void u64(const std::string &key, const std::uint64_t value) { raw(key, std::to_string(value)); }

  void number(const std::string &key, const double value) {
    raw(key, common::json_format_double(value));
  }

  void map(const std::string &key, const Metadata &value) {
    raw(key, common::json_encode_object(value));
  }

  void raw(const std::string &key, const std::string &json) {
    if (!first_) {
      out_.push_back(',');
    }
    first_ = false;
    out_ += common::json_quote(key);
    out_.push_back(':');
    out_ += json;
  }

  [[nodiscard]] std::string finish() {
    out_.push_back('}');
    return std::move(out_);
  }

private:
  std::string out_ = "{";
  bool first_ = true;
};

template <typename T> void write_header(JsonObjectWriter &writer, const T &record) {
  writer.string("record_id", record.record_id);
  writer.string("record_type", std::string(T::kType));
  writer.string("session_id", record.session_id);
  writer.string("timestamp", common::format_iso8601(record.timestamp));
}

std::string encode_messages(const std::vector<llm::ChatMessage> &messages) {
  std::string out = "[";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    JsonObjectWriter writer;
    writer.string("role", messages[i].role);
    writer.string("content", messages[i].content);
    out += writer.finish();
  }
  out.push_back(']');
  return out;
}

std::string encode_usage(const llm::TokenUsage &usage) {
  JsonObjectWriter writer;
  writer.u64("prompt_tokens", usage.prompt_tokens);
  writer.u64("completion_tokens", usage.completion_tokens);
  writer.u64("total_tokens", usage.total_tokens);
  return writer.finish();
}

// Accessors over a raw line; absent keys yield the supplied default.
class RawReader {
public:
  explicit RawReader(const RawRecord &raw) : raw_(raw) {}

  [[nodiscard]] bool has(const std::string &key) const {
    const auto it = raw_.find(key);
    return it != raw_.end() && it->second != "null";
  }

  [[nodiscard]] std::string string(const std::string &key, const std::string &fallback = "") const {
    const auto it = raw_.find(key);
    if (it == raw_.end()) {
      return fallback;
    }
    return it->second;
  }

  [[nodiscard]] std::uint64_t u64(const std::string &key) const {
    const auto it = raw_.find(key);
    if (it == raw_.end()) {
      return 0;
    }
    return common::json_parse_u64(it->second).value_or(0);
  }

  [[nodiscard]] double number(const std::string &key, const double fallback) const {
    const auto it = raw_.find(key);
    if (it == raw_.end()) {
      return fallback;
    }
    return common::json_parse_double(it->second).value_or(fallback);
  }

  [[nodiscard]] Metadata map(const std::string &key) const {
    const auto it = raw_.find(key);
    if (it == raw_.end()) {
      return {};
    }
    return common::json_parse_object(it->second);
  }

private:
  const RawRecord &raw_;
};

std::vector<llm::ChatMessage> decode_messages(const std::string &raw) {
  std::vector<llm::ChatMessage> messages;
  for (const auto &object : common::json_split_top_level_objects(common::trim(raw))) {
    const auto fields = common::json_parse_flat(object);
    llm::ChatMessage message;
    if (const auto it = fields.find("role"); it != fields.end()) {
      message.role = it->second;
    }
    if (const auto it = fields.find("content"); it != fields.end()) {
      message.content = it->second;
    }
    messages.push_back(std::move(message));
  }
  return messages;
}

template <typename T> common::Status read_header(const RawReader &reader, T &record) {
  record.record_id = reader.string("record_id");
  record.session_id = reader.string("session_id");
  if (record.record_id.empty() || record.session_id.empty()) {
    return common::Status::error("record is missing record_id or session_id");
  }
  const auto timestamp = common::parse_iso8601(reader.string("timestamp"));
  if (!timestamp.has_value()) {
    return common::Status::error("record " + record.record_id + " has an invalid timestamp");
  }
  record.timestamp = *timestamp;
  return common::Status::success();
}

template <typename T>
common::Result<HistoryRecord> finish_decode(const common::Status &header, T record) {
  if (!header.ok()) {
    return common::Result<HistoryRecord>::failure(header.error());
  }
  return common::Result<HistoryRecord>::success(HistoryRecord(std::move(record)));
}

} // namespace

std::string message_type_to_string(const MessageType type) {
  switch (type) {
  case MessageType::User:
    return "user";
  case MessageType::Assistant:
    return "assistant";
  case MessageType::System:
    return "system";
  }
  return "user";
}

MessageType message_type_from_string(const std::string_view value) {
  if (value == "assistant") {
    return MessageType::Assistant;
  }
  if (value == "system") {
    return MessageType::System;
  }
  return MessageType::User;
}

std::string token_source_to_string(const TokenSource source) {
  switch (source) {
  case TokenSource::Local:
    return "local";
  case TokenSource::Api:
    return "api";
  case TokenSource::Hybrid:
    return "hybrid";
  }
  return "local";
}

TokenSource token_source_from_string(const std::string_view value) {
  if (value == "api") {
    return TokenSource::Api;
  }
  if (value == "hybrid") {
    return TokenSource::Hybrid;
  }
  return TokenSource::Local;
}

std::string_view record_type_of(const HistoryRecord &record) {
  return std::visit([](const auto &r) { return std::decay_t<decltype(r)>::kType; }, record);
}

const std::string &record_id_of(const HistoryRecord &record) {
  return std::visit([](const auto &r) -> const std::string & { return r.record_id; }, record);
}

const std::string &session_id_of(const HistoryRecord &record) {
  return std::visit([](const auto &r) -> const std::string & { return r.session_id; }, record);
}

common::Timestamp timestamp_of(const HistoryRecord &record) {
  return std::visit([](const auto &r) { return r.timestamp; }, record);
}

RecordHeader record_header(const HistoryRecord &record) {
  return std::visit(
      [](const auto &r) {
        return RecordHeader{.record_id = r.record_id,
                            .session_id = r.session_id,
                            .timestamp = r.timestamp,
                            .record_type = std::decay_t<decltype(r)>::kType};
      },
      record);
}

void fill_header(HistoryRecord &record, const std::string &session_id,
                 const common::Timestamp timestamp) {
  std::visit(
      [&](auto &r) {
        if (r.record_id.empty()) {
          r.record_id = common::generate_id();
        }
        if (r.session_id.empty()) {
          r.session_id = session_id;
        }
        if (r.timestamp == common::Timestamp{}) {
          r.timestamp = timestamp;
        }
      },
      record);
}

common::Status validate_record(const HistoryRecord &record) {
  if (common::trim(record_id_of(record)).empty()) {
    return common::Status::error(std::string(record_type_of(record)) + " record has no record_id");
  }
  if (common::trim(session_id_of(record)).empty()) {
    return common::Status::error(std::string(record_type_of(record)) + " record " +
                                 record_id_of(record) + " has no session_id");
  }

  return std::visit(
      [](const auto &r) -> common::Status {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ToolCallRecord>) {
          if (common::trim(r.tool_name).empty()) {
            return common::Status::error("tool_call record " + r.record_id + " has no tool_name");
          }
        } else if constexpr (std::is_same_v<T, LlmRequestRecord> ||
                             std::is_same_v<T, CostRecord>) {
          if (common::trim(r.model).empty()) {
            return common::Status::error(std::string(T::kType) + " record " + r.record_id +
                                         " has no model");
          }
        } else if constexpr (std::is_same_v<T, TokenUsageRecord>) {
          if (common::trim(r.model).empty()) {
            return common::Status::error("token_usage record " + r.record_id + " has no model");
          }
          if (r.confidence < 0.0 || r.confidence > 1.0) {
            return common::Status::error("token_usage record " + r.record_id +
                                         " has confidence outside [0, 1]");
          }
        } else if constexpr (std::is_same_v<T, LlmResponseRecord>) {
          if (common::trim(r.request_id).empty()) {
            return common::Status::error("llm_response record " + r.record_id +
                                         " has no request_id");
          }
        }
        return common::Status::success();
      },
      record);
}

std::string encode_record_json(const HistoryRecord &record) {
  return std::visit(
      [](const auto &r) {
        using T = std::decay_t<decltype(r)>;
        JsonObjectWriter writer;
        write_header(writer, r);
        if constexpr (std::is_same_v<T, MessageRecord>) {
          writer.string("message_type", message_type_to_string(r.message_type));
          writer.string("content", r.content);
        } else if constexpr (std::is_same_v<T, ToolCallRecord>) {
          writer.string("tool_name", r.tool_name);
          writer.map("tool_input", r.tool_input);
          if (r.tool_output.has_value()) {
            writer.map("tool_output", *r.tool_output);
          } else {
            writer.raw("tool_output", "null");
          }
        } else if constexpr (std::is_same_v<T, LlmRequestRecord>) {
          writer.string("model", r.model);
          writer.string("provider", r.provider);
          writer.raw("messages", encode_messages(r.messages));
          writer.map("parameters", r.parameters);
          if (r.estimated_tokens.has_value()) {
            writer.u64("estimated_tokens", *r.estimated_tokens);
          } else {
            writer.raw("estimated_tokens", "null");
          }
        } else if constexpr (std::is_same_v<T, LlmResponseRecord>) {
          writer.string("request_id", r.request_id);
          writer.string("content", r.content);
          writer.string("finish_reason", r.finish_reason);
          writer.raw("token_usage", encode_usage(r.token_usage));
          writer.number("response_time", r.response_time);
          writer.string("model", r.model);
        } else if constexpr (std::is_same_v<T, TokenUsageRecord>) {
          writer.string("model", r.model);
          writer.string("provider", r.provider);
          writer.u64("prompt_tokens", r.prompt_tokens);
          writer.u64("completion_tokens", r.completion_tokens);
          writer.u64("total_tokens", r.total_tokens);
          writer.string("source", token_source_to_string(r.source));
          writer.number("confidence", r.confidence);
        } else if constexpr (std::is_same_v<T, CostRecord>) {
          writer.string("model", r.model);
          writer.string("provider", r.provider);
          writer.u64("prompt_tokens", r.prompt_tokens);
          writer.u64("completion_tokens", r.completion_tokens);
          writer.u64("total_tokens", r.total_tokens);
          writer.number("prompt_cost", r.prompt_cost);
          writer.number("completion_cost", r.completion_cost);
          writer.number("total_cost", r.total_cost);
          writer.string("currency", r.currency);
        }
        writer.map("metadata", r.metadata);
        return writer.finish();
      },
      record);
}

common::Result<HistoryRecord> record_from_raw(const RawRecord &raw) {
  const RawReader reader(raw);
  const std::string type = reader.string("record_type");

  if (type == MessageRecord::kType) {
    MessageRecord record;
    const auto header = read_header(reader, record);
    record.message_type = message_type_from_string(reader.string("message_type"));
    record.content = reader.string("content");
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  if (type == ToolCallRecord::kType) {
    ToolCallRecord record;
    const auto header = read_header(reader, record);
    record.tool_name = reader.string("tool_name");
    record.tool_input = reader.map("tool_input");
    if (reader.has("tool_output")) {
      record.tool_output = reader.map("tool_output");
    }
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  if (type == LlmRequestRecord::kType) {
    LlmRequestRecord record;
    const auto header = read_header(reader, record);
    record.model = reader.string("model");
    record.provider = reader.string("provider");
    record.messages = decode_messages(reader.string("messages", "[]"));
    record.parameters = reader.map("parameters");
    if (reader.has("estimated_tokens")) {
      record.estimated_tokens = common::json_parse_u64(reader.string("estimated_tokens"));
    }
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  if (type == LlmResponseRecord::kType) {
    LlmResponseRecord record;
    const auto header = read_header(reader, record);
    record.request_id = reader.string("request_id");
    record.content = reader.string("content");
    record.finish_reason = reader.string("finish_reason");
    const RawRecord usage = common::json_parse_flat(reader.string("token_usage", "{}"));
    const RawReader usage_reader(usage);
    record.token_usage.prompt_tokens = usage_reader.u64("prompt_tokens");
    record.token_usage.completion_tokens = usage_reader.u64("completion_tokens");
    record.token_usage.total_tokens = usage_reader.u64("total_tokens");
    record.response_time = reader.number("response_time", 0.0);
    record.model = reader.string("model");
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  if (type == TokenUsageRecord::kType) {
    TokenUsageRecord record;
    const auto header = read_header(reader, record);
    record.model = reader.string("model");
    record.provider = reader.string("provider");
    record.prompt_tokens = reader.u64("prompt_tokens");
    record.completion_tokens = reader.u64("completion_tokens");
    record.total_tokens = reader.u64("total_tokens");
    record.source = token_source_from_string(reader.string("source"));
    record.confidence = std::clamp(reader.number("confidence", 1.0), 0.0, 1.0);
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  if (type == CostRecord::kType) {
    CostRecord record;
    const auto header = read_header(reader, record);
    record.model = reader.string("model");
    record.provider = reader.string("provider");
    record.prompt_tokens = reader.u64("prompt_tokens");
    record.completion_tokens = reader.u64("completion_tokens");
    record.total_tokens = reader.u64("total_tokens");
    record.prompt_cost = reader.number("prompt_cost", 0.0);
    record.completion_cost = reader.number("completion_cost", 0.0);
    record.total_cost = reader.number("total_cost", 0.0);
    record.currency = reader.string("currency", "USD");
    if (record.currency.empty()) {
      record.currency = "USD";
    }
    record.metadata = reader.map("metadata");
    return finish_decode(header, std::move(record));
  }

  return common::Result<HistoryRecord>::failure("unknown record_type '" + type + "'");
}

common::Result<HistoryRecord> parse_record_json(const std::string &line) {
  if (!common::json_is_valid_object(line)) {
    return common::Result<HistoryRecord>::failure("malformed record line");
  }
  return record_from_raw(common::json_parse_flat(line));
}

} // namespace chronicle::history
