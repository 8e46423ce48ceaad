#include "chronicle/history/manager.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/history/session_context.hpp"
#include "chronicle/observability/global.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace chronicle::history {

namespace {

constexpr const char *COMPONENT = "history.manager";

template <typename T> std::vector<T> only(const std::vector<HistoryRecord> &records) {
  std::vector<T> out;
  for (const auto &record : records) {
    if (const auto *typed = std::get_if<T>(&record); typed != nullptr) {
      out.push_back(*typed);
    }
  }
  return out;
}

void add_model(std::vector<std::string> &models, const std::string &model) {
  if (std::find(models.begin(), models.end(), model) == models.end()) {
    models.push_back(model);
  }
}

std::string json_string_list(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += common::json_quote(values[i]);
  }
  out += "]";
  return out;
}

std::string json_count_map(const std::map<std::string, std::size_t> &values) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, count] : values) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += common::json_quote(key) + ":" + std::to_string(count);
  }
  out += "}";
  return out;
}

std::string csv_field(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"') {
      out += "\"\"";
    } else {
      out.push_back(ch);
    }
  }
  out += "\"";
  return out;
}

// role/content columns of the CSV export.
std::pair<std::string, std::string> csv_columns(const HistoryRecord &record) {
  return std::visit(
      [](const auto &r) -> std::pair<std::string, std::string> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, MessageRecord>) {
          return {message_type_to_string(r.message_type), r.content};
        } else if constexpr (std::is_same_v<T, ToolCallRecord>) {
          return {"tool", r.tool_name};
        } else if constexpr (std::is_same_v<T, LlmRequestRecord>) {
          return {"request", r.provider + ":" + r.model};
        } else if constexpr (std::is_same_v<T, LlmResponseRecord>) {
          return {"assistant", r.content};
        } else if constexpr (std::is_same_v<T, TokenUsageRecord>) {
          return {token_source_to_string(r.source), std::to_string(r.total_tokens)};
        } else {
          return {r.currency, common::json_format_double(r.total_cost)};
        }
      },
      record);
}

} // namespace

common::Result<ExportFormat> export_format_from_string(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "json") {
    return common::Result<ExportFormat>::success(ExportFormat::Json);
  }
  if (normalized == "jsonl") {
    return common::Result<ExportFormat>::success(ExportFormat::Jsonl);
  }
  if (normalized == "csv") {
    return common::Result<ExportFormat>::success(ExportFormat::Csv);
  }
  return common::Result<ExportFormat>::failure("unsupported export format: " +
                                               std::string(value));
}

HistoryManager::HistoryManager(std::shared_ptr<IHistoryStorage> storage, Clock clock)
    : storage_(std::move(storage)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::now_timestamp;
  }
}

bool HistoryManager::record(HistoryRecord record) {
  if (session_id_of(record).empty()) {
    const auto current = get_current();
    if (!current.has_value()) {
      observability::record_debug(COMPONENT, "dropped " + std::string(record_type_of(record)) +
                                                 " record without a session");
      return false;
    }
    fill_header(record, *current, clock_());
  } else {
    fill_header(record, session_id_of(record), clock_());
  }
  return storage_->store(record);
}

bool HistoryManager::record_message(MessageRecord record) {
  return this->record(HistoryRecord(std::move(record)));
}

bool HistoryManager::record_tool_call(ToolCallRecord record) {
  return this->record(HistoryRecord(std::move(record)));
}

std::vector<HistoryRecord> HistoryManager::load_records(const std::string &session_id) {
  std::vector<HistoryRecord> records;
  for (const auto &raw : storage_->read_all(session_id)) {
    auto parsed = record_from_raw(raw);
    if (!parsed.ok()) {
      observability::record_debug(COMPONENT, "skipped record in " + session_id + ": " +
                                                 parsed.error());
      continue;
    }
    records.push_back(std::move(parsed.value()));
  }
  return records;
}

HistoryResult HistoryManager::query(const HistoryQuery &query) {
  HistoryResult result;
  std::vector<HistoryRecord> matched;
  for (auto &record : load_records(query.session_id)) {
    const auto timestamp = timestamp_of(record);
    if (query.start_time.has_value() && timestamp < *query.start_time) {
      continue;
    }
    if (query.end_time.has_value() && timestamp > *query.end_time) {
      continue;
    }
    if (!query.record_types.empty() &&
        !query.record_types.contains(std::string(record_type_of(record)))) {
      continue;
    }
    matched.push_back(std::move(record));
  }

  result.total = matched.size();
  const std::size_t offset = std::min(query.offset.value_or(0), matched.size());
  std::size_t end = matched.size();
  if (query.limit.has_value()) {
    end = offset + std::min(*query.limit, matched.size() - offset);
  }
  const auto first = matched.begin() + static_cast<std::ptrdiff_t>(offset);
  const auto last = matched.begin() + static_cast<std::ptrdiff_t>(end);
  result.records.assign(std::make_move_iterator(first), std::make_move_iterator(last));
  return result;
}

TokenStatistics HistoryManager::get_token_statistics(const std::string &session_id) {
  TokenStatistics stats;
  stats.session_id = session_id;
  // Every line counts, including the local estimate and its api reconciliation.
  for (const auto &usage : only<TokenUsageRecord>(load_records(session_id))) {
    stats.prompt_tokens += usage.prompt_tokens;
    stats.completion_tokens += usage.completion_tokens;
    stats.total_tokens += usage.total_tokens;
    ++stats.total_requests;
    add_model(stats.models, usage.model);

    auto &model = stats.model_breakdown[usage.model];
    model.prompt_tokens += usage.prompt_tokens;
    model.completion_tokens += usage.completion_tokens;
    model.total_tokens += usage.total_tokens;
    ++model.request_count;
  }
  if (stats.total_requests > 0) {
    stats.avg_tokens_per_request =
        static_cast<double>(stats.total_tokens) / static_cast<double>(stats.total_requests);
  }
  return stats;
}

CostStatistics HistoryManager::get_cost_statistics(const std::string &session_id) {
  CostStatistics stats;
  stats.session_id = session_id;
  const auto costs = only<CostRecord>(load_records(session_id));
  if (!costs.empty()) {
    stats.currency = costs.front().currency;
  }
  for (const auto &cost : costs) {
    stats.total_cost += cost.total_cost;
    stats.prompt_cost += cost.prompt_cost;
    stats.completion_cost += cost.completion_cost;
    ++stats.total_requests;
    add_model(stats.models, cost.model);

    auto &model = stats.model_breakdown[cost.model];
    model.total_cost += cost.total_cost;
    model.total_tokens += cost.total_tokens;
    ++model.request_count;
  }
  for (auto &[name, model] : stats.model_breakdown) {
    (void)name;
    model.avg_cost_per_request = model.total_cost / static_cast<double>(model.request_count);
    if (model.total_tokens > 0) {
      model.avg_cost_per_token = model.total_cost / static_cast<double>(model.total_tokens);
    }
  }
  if (stats.total_requests > 0) {
    stats.avg_cost_per_request = stats.total_cost / static_cast<double>(stats.total_requests);
  }
  return stats;
}

LlmStatistics HistoryManager::get_llm_statistics(const std::string &session_id) {
  LlmStatistics stats;
  stats.session_id = session_id;
  const auto records = load_records(session_id);

  for (const auto &request : only<LlmRequestRecord>(records)) {
    ++stats.total_requests;
    add_model(stats.models, request.model);
    ++stats.model_breakdown[request.model].request_count;
  }

  double total_response_time = 0.0;
  for (const auto &response : only<LlmResponseRecord>(records)) {
    ++stats.total_responses;
    total_response_time += response.response_time;
    if (response.finish_reason == "error") {
      ++stats.error_responses;
    }
    ++stats.finish_reason_distribution[response.finish_reason];
    if (!response.model.empty()) {
      add_model(stats.models, response.model);
    }

    auto &model = stats.model_breakdown[response.model];
    ++model.response_count;
    model.total_response_time += response.response_time;
    ++model.finish_reasons[response.finish_reason];
  }

  for (auto &[name, model] : stats.model_breakdown) {
    (void)name;
    if (model.response_count > 0) {
      model.avg_response_time =
          model.total_response_time / static_cast<double>(model.response_count);
    }
  }
  if (stats.total_responses > 0) {
    const auto responses = static_cast<double>(stats.total_responses);
    stats.avg_response_time = total_response_time / responses;
    stats.success_rate =
        static_cast<double>(stats.total_responses - stats.error_responses) / responses * 100.0;
  }
  return stats;
}

CleanupResult HistoryManager::cleanup(const common::Timestamp cutoff, const bool dry_run) {
  CleanupResult result;
  result.cutoff_date = cutoff;
  result.dry_run = dry_run;
  result.cleaned_records = dry_run ? storage_->count_before(cutoff) : storage_->cleanup(cutoff);
  return result;
}

std::vector<MessageRecord> HistoryManager::search_messages(const std::string &session_id,
                                                           const std::string &text,
                                                           const std::size_t limit) {
  const std::string needle = common::to_lower(text);
  std::vector<MessageRecord> out;
  for (auto &message : only<MessageRecord>(load_records(session_id))) {
    if (common::to_lower(message.content).find(needle) == std::string::npos) {
      continue;
    }
    out.push_back(std::move(message));
    if (limit > 0 && out.size() >= limit) {
      break;
    }
  }
  return out;
}

common::Result<std::string> HistoryManager::export_session(const std::string &session_id,
                                                           const ExportFormat format) {
  if (common::trim(session_id).empty()) {
    return common::Result<std::string>::failure("session id is required");
  }
  const auto records = load_records(session_id);

  std::ostringstream out;
  switch (format) {
  case ExportFormat::Jsonl:
    for (const auto &record : records) {
      out << encode_record_json(record) << "\n";
    }
    break;
  case ExportFormat::Csv:
    out << "timestamp,record_type,role,content\n";
    for (const auto &record : records) {
      const auto [role, content] = csv_columns(record);
      out << common::format_iso8601(timestamp_of(record)) << "," << record_type_of(record) << ","
          << csv_field(role) << "," << csv_field(content) << "\n";
    }
    break;
  case ExportFormat::Json:
    out << "{\"session_id\":" << common::json_quote(session_id)
        << ",\"export_timestamp\":" << common::json_quote(common::format_iso8601(clock_()))
        << ",\"record_count\":" << records.size() << ",\"records\":[";
    for (std::size_t i = 0; i < records.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << encode_record_json(records[i]);
    }
    out << "]}";
    break;
  }
  return common::Result<std::string>::success(out.str());
}

std::vector<std::string> HistoryManager::list_sessions() { return storage_->list_sessions(); }

StorageInfo HistoryManager::storage_info() { return storage_->storage_info(); }

std::string encode_history_result_json(const HistoryResult &result) {
  std::ostringstream out;
  out << "{\"total\":" << result.total << ",\"records\":[";
  for (std::size_t i = 0; i < result.records.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << encode_record_json(result.records[i]);
  }
  out << "]}";
  return out.str();
}

std::string encode_token_statistics_json(const TokenStatistics &stats) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(stats.session_id)
      << ",\"prompt_tokens\":" << stats.prompt_tokens
      << ",\"completion_tokens\":" << stats.completion_tokens
      << ",\"total_tokens\":" << stats.total_tokens << ",\"total_requests\":" << stats.total_requests
      << ",\"avg_tokens_per_request\":" << common::json_format_double(stats.avg_tokens_per_request)
      << ",\"models\":" << json_string_list(stats.models) << ",\"model_breakdown\":{";
  bool first = true;
  for (const auto &[name, model] : stats.model_breakdown) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(name) << ":{\"prompt_tokens\":" << model.prompt_tokens
        << ",\"completion_tokens\":" << model.completion_tokens
        << ",\"total_tokens\":" << model.total_tokens
        << ",\"request_count\":" << model.request_count << "}";
  }
  out << "}}";
  return out.str();
}

std::string encode_cost_statistics_json(const CostStatistics &stats) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(stats.session_id)
      << ",\"total_cost\":" << common::json_format_double(stats.total_cost)
      << ",\"prompt_cost\":" << common::json_format_double(stats.prompt_cost)
      << ",\"completion_cost\":" << common::json_format_double(stats.completion_cost)
      << ",\"currency\":" << common::json_quote(stats.currency)
      << ",\"total_requests\":" << stats.total_requests
      << ",\"avg_cost_per_request\":" << common::json_format_double(stats.avg_cost_per_request)
      << ",\"models\":" << json_string_list(stats.models) << ",\"model_breakdown\":{";
  bool first = true;
  for (const auto &[name, model] : stats.model_breakdown) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(name)
        << ":{\"total_cost\":" << common::json_format_double(model.total_cost)
        << ",\"total_tokens\":" << model.total_tokens
        << ",\"request_count\":" << model.request_count
        << ",\"avg_cost_per_request\":" << common::json_format_double(model.avg_cost_per_request)
        << ",\"avg_cost_per_token\":" << common::json_format_double(model.avg_cost_per_token)
        << "}";
  }
  out << "}}";
  return out.str();
}

std::string encode_llm_statistics_json(const LlmStatistics &stats) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(stats.session_id)
      << ",\"total_requests\":" << stats.total_requests
      << ",\"total_responses\":" << stats.total_responses
      << ",\"error_responses\":" << stats.error_responses
      << ",\"success_rate\":" << common::json_format_double(stats.success_rate)
      << ",\"avg_response_time\":" << common::json_format_double(stats.avg_response_time)
      << ",\"models\":" << json_string_list(stats.models)
      << ",\"finish_reason_distribution\":" << json_count_map(stats.finish_reason_distribution)
      << ",\"model_breakdown\":{";
  bool first = true;
  for (const auto &[name, model] : stats.model_breakdown) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(name) << ":{\"request_count\":" << model.request_count
        << ",\"response_count\":" << model.response_count
        << ",\"total_response_time\":" << common::json_format_double(model.total_response_time)
        << ",\"avg_response_time\":" << common::json_format_double(model.avg_response_time)
        << ",\"finish_reasons\":" << json_count_map(model.finish_reasons) << "}";
  }
  out << "}}";
  return out.str();
}

std::string encode_cleanup_result_json(const CleanupResult &result) {
  std::ostringstream out;
  out << "{\"cleaned_records\":" << result.cleaned_records
      << ",\"cutoff_date\":" << common::json_quote(common::format_iso8601(result.cutoff_date));
  if (result.dry_run) {
    out << ",\"dry_run\":true";
  }
  out << "}";
  return out.str();
}

std::string encode_storage_info_json(const StorageInfo &info) {
  std::ostringstream out;
  out << "{\"base_dir\":" << common::json_quote(info.base_dir.string())
      << ",\"session_count\":" << info.session_count << ",\"file_count\":" << info.file_count
      << ",\"partition_count\":" << info.partition_count
      << ",\"total_bytes\":" << info.total_bytes << "}";
  return out.str();
}

} // namespace chronicle::history
