#include "chronicle/cli/commands.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/common/time.hpp"
#include "chronicle/config/config.hpp"
#include "chronicle/history/manager.hpp"
#include "chronicle/history/storage.hpp"
#include "chronicle/observability/factory.hpp"
#include "chronicle/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::size_t> parse_count(const std::string &text) {
  std::size_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

common::Timestamp days_ago(const std::uint64_t days) {
  const auto bounded = std::min<std::uint64_t>(days, config::kMaxRetentionDays);
  return common::now_timestamp() - std::chrono::hours(24) * static_cast<long>(bounded);
}

int fail(const std::string &message) {
  std::cerr << "error: " << message << "\n";
  return 1;
}

struct Runtime {
  config::Config config;
  std::shared_ptr<history::FileHistoryStorage> storage;
  std::unique_ptr<history::HistoryManager> manager;
};

common::Result<Runtime> open_runtime() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<Runtime>::failure(cfg.error());
  }
  const auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<Runtime>::failure("invalid configuration: " + warnings.error());
  }

  observability::set_global_observer(observability::create_observer(cfg.value().observability));
  for (const auto &warning : warnings.value()) {
    observability::record_debug("config", warning);
  }

  const auto dir = config::resolve_history_dir(cfg.value());
  if (!dir.ok()) {
    return common::Result<Runtime>::failure(dir.error());
  }

  Runtime runtime;
  runtime.config = cfg.value();
  runtime.storage = std::make_shared<history::FileHistoryStorage>(dir.value());
  runtime.manager = std::make_unique<history::HistoryManager>(runtime.storage);
  return common::Result<Runtime>::success(std::move(runtime));
}

int run_sessions(history::HistoryManager &manager) {
  const auto sessions = manager.list_sessions();
  std::cout << "[";
  for (std::size_t i = 0; i < sessions.size(); ++i) {
    if (i > 0) {
      std::cout << ",";
    }
    std::cout << common::json_quote(sessions[i]);
  }
  std::cout << "]\n";
  return 0;
}

int run_query(history::HistoryManager &manager, std::vector<std::string> args) {
  history::HistoryQuery query;
  std::string value;
  while (take_option(args, "--type", "-t", value)) {
    query.record_types.insert(value);
  }
  if (take_option(args, "--since", "", value)) {
    const auto since = common::parse_iso8601(value);
    if (!since.has_value()) {
      return fail("invalid --since timestamp: " + value);
    }
    query.start_time = since;
  }
  if (take_option(args, "--until", "", value)) {
    const auto until = common::parse_iso8601(value);
    if (!until.has_value()) {
      return fail("invalid --until timestamp: " + value);
    }
    query.end_time = until;
  }
  if (take_option(args, "--limit", "-n", value)) {
    const auto limit = parse_count(value);
    if (!limit.has_value()) {
      return fail("invalid --limit: " + value);
    }
    query.limit = limit;
  }
  if (take_option(args, "--offset", "", value)) {
    const auto offset = parse_count(value);
    if (!offset.has_value()) {
      return fail("invalid --offset: " + value);
    }
    query.offset = offset;
  }
  if (args.size() != 1) {
    return fail("usage: chronicle query <session> [--type T]... [--since ISO] [--until ISO] "
                "[--limit N] [--offset N]");
  }
  query.session_id = args[0];

  std::cout << history::encode_history_result_json(manager.query(query)) << "\n";
  return 0;
}

int run_stats(history::HistoryManager &manager, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return fail("usage: chronicle stats <session>");
  }
  const std::string &session = args[0];
  std::cout << "{\"tokens\":"
            << history::encode_token_statistics_json(manager.get_token_statistics(session))
            << ",\"cost\":"
            << history::encode_cost_statistics_json(manager.get_cost_statistics(session))
            << ",\"llm\":"
            << history::encode_llm_statistics_json(manager.get_llm_statistics(session)) << "}\n";
  return 0;
}

int run_cleanup(history::HistoryManager &manager, const config::Config &cfg,
                std::vector<std::string> args) {
  const bool dry_run = take_flag(args, "--dry-run");
  std::string value;
  common::Timestamp cutoff = days_ago(cfg.history.retention_days);

  const bool has_before = take_option(args, "--before", "", value);
  if (has_before) {
    const auto before = common::parse_iso8601(value);
    if (!before.has_value()) {
      return fail("invalid --before timestamp: " + value);
    }
    cutoff = *before;
  }
  if (take_option(args, "--days", "", value)) {
    if (has_before) {
      return fail("--before and --days are mutually exclusive");
    }
    const auto days = parse_count(value);
    if (!days.has_value() || *days > config::kMaxRetentionDays) {
      return fail("invalid --days: " + value + " (at most " +
                  std::to_string(config::kMaxRetentionDays) + ")");
    }
    cutoff = days_ago(*days);
  }
  if (!args.empty()) {
    return fail("usage: chronicle cleanup [--before ISO | --days N] [--dry-run]");
  }

  std::cout << history::encode_cleanup_result_json(manager.cleanup(cutoff, dry_run)) << "\n";
  return 0;
}

int run_export(history::HistoryManager &manager, std::vector<std::string> args) {
  std::string value = "json";
  (void)take_option(args, "--format", "-f", value);
  const auto format = history::export_format_from_string(value);
  if (!format.ok()) {
    return fail(format.error());
  }
  if (args.size() != 1) {
    return fail("usage: chronicle export <session> [--format json|jsonl|csv]");
  }

  const auto exported = manager.export_session(args[0], format.value());
  if (!exported.ok()) {
    return fail(exported.error());
  }
  std::cout << exported.value();
  if (format.value() == history::ExportFormat::Json) {
    std::cout << "\n";
  }
  return 0;
}

int run_info(history::HistoryManager &manager) {
  const auto path = config::config_path();
  std::cout << "{\"version\":" << common::json_quote(version_string())
            << ",\"config_path\":" << common::json_quote(path.ok() ? path.value().string() : "")
            << ",\"storage\":" << history::encode_storage_info_json(manager.storage_info())
            << "}\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  chronicle [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  sessions                 List recorded sessions\n";
  std::cout << "  query <session>          Records of a session\n";
  std::cout << "      --type T             Keep only this record type (repeatable)\n";
  std::cout << "      --since ISO          Inclusive lower time bound\n";
  std::cout << "      --until ISO          Inclusive upper time bound\n";
  std::cout << "      --limit N            Page size\n";
  std::cout << "      --offset N           Records to skip\n";
  std::cout << "  stats <session>          Token, cost and LLM statistics\n";
  std::cout << "  cleanup                  Remove records older than the retention window\n";
  std::cout << "      --before ISO         Explicit cutoff\n";
  std::cout << "      --days N             Cutoff N days ago\n";
  std::cout << "      --dry-run            Count without removing\n";
  std::cout << "  export <session>         Dump a session\n";
  std::cout << "      --format F           json (default), jsonl or csv\n";
  std::cout << "  info                     Storage location and size\n";
  std::cout << "  version                  Show version\n";
}

} // namespace

std::string version_string() {
#ifdef CHRONICLE_VERSION
  return std::string("chronicle ") + CHRONICLE_VERSION;
#else
  return "chronicle 0.1.0";
#endif
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand != "sessions" && subcommand != "query" && subcommand != "stats" &&
      subcommand != "cleanup" && subcommand != "export" && subcommand != "info") {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return 1;
  }

  auto runtime = open_runtime();
  if (!runtime.ok()) {
    return fail(runtime.error());
  }
  auto &manager = *runtime.value().manager;

  if (subcommand == "sessions") {
    return run_sessions(manager);
  }
  if (subcommand == "query") {
    return run_query(manager, std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats(manager, args);
  }
  if (subcommand == "cleanup") {
    return run_cleanup(manager, runtime.value().config, std::move(args));
  }
  if (subcommand == "export") {
    return run_export(manager, std::move(args));
  }
  return run_info(manager);
}

} // namespace chronicle::cli
