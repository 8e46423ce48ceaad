#pragma once

#include "chronicle/common/result.hpp"
#include "chronicle/common/time.hpp"
#include "chronicle/history/record.hpp"
#include "chronicle/history/storage.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::history {

struct HistoryQuery {
  std::string session_id;
  /// Inclusive bounds.
  std::optional<common::Timestamp> start_time;
  std::optional<common::Timestamp> end_time;
  /// Discriminators to keep; empty keeps every type.
  std::set<std::string> record_types;
  std::optional<std::size_t> limit;
  std::optional<std::size_t> offset;
};

struct HistoryResult {
  std::vector<HistoryRecord> records;
  /// Matching records before pagination.
  std::size_t total = 0;
};

struct ModelTokenStats {
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;
  std::size_t request_count = 0;
};

struct TokenStatistics {
  std::string session_id;
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;
  std::size_t total_requests = 0;
  double avg_tokens_per_request = 0.0;
  std::vector<std::string> models;
  std::map<std::string, ModelTokenStats> model_breakdown;
};

struct ModelCostStats {
  double total_cost = 0.0;
  std::uint64_t total_tokens = 0;
  std::size_t request_count = 0;
  double avg_cost_per_request = 0.0;
  double avg_cost_per_token = 0.0;
};

struct CostStatistics {
  std::string session_id;
  double total_cost = 0.0;
  double prompt_cost = 0.0;
  double completion_cost = 0.0;
  std::string currency = "USD";
  std::size_t total_requests = 0;
  double avg_cost_per_request = 0.0;
  std::vector<std::string> models;
  std::map<std::string, ModelCostStats> model_breakdown;
};

struct ModelLlmStats {
  std::size_t request_count = 0;
  std::size_t response_count = 0;
  double total_response_time = 0.0;
  double avg_response_time = 0.0;
  std::map<std::string, std::size_t> finish_reasons;
};

struct LlmStatistics {
  std::string session_id;
  std::size_t total_requests = 0;
  std::size_t total_responses = 0;
  std::size_t error_responses = 0;
  /// Percent of responses not finished with "error"; 100 when there are none.
  double success_rate = 100.0;
  double avg_response_time = 0.0;
  std::vector<std::string> models;
  std::map<std::string, ModelLlmStats> model_breakdown;
  std::map<std::string, std::size_t> finish_reason_distribution;
};

struct CleanupResult {
  std::size_t cleaned_records = 0;
  common::Timestamp cutoff_date{};
  bool dry_run = false;
};

enum class ExportFormat {
  Json,
  Jsonl,
  Csv,
};

[[nodiscard]] common::Result<ExportFormat> export_format_from_string(std::string_view value);

/// Read, aggregate and retention side of the history store, plus the typed
/// write conveniences used outside the call hook.
class HistoryManager {
public:
  explicit HistoryManager(std::shared_ptr<IHistoryStorage> storage,
                          Clock clock = common::now_timestamp);

  /// Fills an empty record_id or timestamp, takes the session from the current
  /// session scope when the record has none, then stores.
  bool record(HistoryRecord record);
  bool record_message(MessageRecord record);
  bool record_tool_call(ToolCallRecord record);

  [[nodiscard]] HistoryResult query(const HistoryQuery &query);

  [[nodiscard]] TokenStatistics get_token_statistics(const std::string &session_id);
  [[nodiscard]] CostStatistics get_cost_statistics(const std::string &session_id);
  [[nodiscard]] LlmStatistics get_llm_statistics(const std::string &session_id);

  [[nodiscard]] CleanupResult cleanup(common::Timestamp cutoff, bool dry_run = false);

  /// Case-insensitive substring match over message contents, oldest first.
  /// A zero limit returns every match.
  [[nodiscard]] std::vector<MessageRecord>
  search_messages(const std::string &session_id, const std::string &text, std::size_t limit = 0);

  [[nodiscard]] common::Result<std::string> export_session(const std::string &session_id,
                                                           ExportFormat format);

  [[nodiscard]] std::vector<std::string> list_sessions();
  [[nodiscard]] StorageInfo storage_info();

private:
  [[nodiscard]] std::vector<HistoryRecord> load_records(const std::string &session_id);

  std::shared_ptr<IHistoryStorage> storage_;
  Clock clock_;
};

[[nodiscard]] std::string encode_history_result_json(const HistoryResult &result);
[[nodiscard]] std::string encode_token_statistics_json(const TokenStatistics &stats);
[[nodiscard]] std::string encode_cost_statistics_json(const CostStatistics &stats);
[[nodiscard]] std::string encode_llm_statistics_json(const LlmStatistics &stats);
/// `{"cleaned_records":N,"cutoff_date":"<ISO-8601>"}`, plus `"dry_run":true` for a
/// dry run.
[[nodiscard]] std::string encode_cleanup_result_json(const CleanupResult &result);
[[nodiscard]] std::string encode_storage_info_json(const StorageInfo &info);

} // namespace chronicle::history
