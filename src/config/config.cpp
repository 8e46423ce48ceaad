#include "chronicle/config/config.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/common/toml.hpp"

#include <cstdlib>
#include <set>

namespace chronicle::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".chronicle";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *HISTORY_FOLDER = "history";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const auto env = env_value("CHRONICLE_CONFIG"); env.has_value()) {
    return std::filesystem::path(common::expand_path(*env));
  }
  return std::nullopt;
}

const std::set<std::string> &pricing_scalar_keys() {
  static const std::set<std::string> keys = {"default_prompt_price_per_1k",
                                             "default_completion_price_per_1k", "currency"};
  return keys;
}

common::Result<ModelPricingEntry> parse_pricing_entry(const std::string &key,
                                                      const common::TomlDocument &doc) {
  const std::size_t colon = key.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == key.size()) {
    return common::Result<ModelPricingEntry>::failure(
        "pricing key must be \"provider:model\": " + key);
  }

  const auto parts = doc.get_string_array("pricing." + key);
  if (parts.size() < 2 || parts.size() > 3) {
    return common::Result<ModelPricingEntry>::failure(
        "pricing." + key + " must be [prompt_per_1k, completion_per_1k, \"currency\"]");
  }

  const auto prompt = common::json_parse_double(parts[0]);
  const auto completion = common::json_parse_double(parts[1]);
  if (!prompt.has_value() || !completion.has_value()) {
    return common::Result<ModelPricingEntry>::failure("pricing." + key +
                                                      " has a non-numeric price");
  }

  ModelPricingEntry entry;
  entry.provider = key.substr(0, colon);
  entry.model = key.substr(colon + 1);
  entry.prompt_price_per_1k = *prompt;
  entry.completion_price_per_1k = *completion;
  if (parts.size() == 3) {
    entry.currency = parts[2];
  } else {
    entry.currency = doc.get_string("pricing.currency", "USD");
  }
  return common::Result<ModelPricingEntry>::success(std::move(entry));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto home = env_value("CHRONICLE_HOME"); home.has_value()) {
    return common::ensure_dir(common::expand_path(*home));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const auto dir = env_value("CHRONICLE_HISTORY_DIR"); dir.has_value()) {
    config.history.base_dir = *dir;
  }
  if (const auto backend = env_value("CHRONICLE_OBSERVER"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &history = config.history;
  history.base_dir = doc.get_string("history.base_dir", history.base_dir);
  history.queue_capacity = doc.get_u64("history.queue_capacity", history.queue_capacity);
  history.worker_count =
      static_cast<std::uint32_t>(doc.get_u64("history.worker_count", history.worker_count));
  history.pending_ttl_seconds =
      doc.get_u64("history.pending_ttl_seconds", history.pending_ttl_seconds);
  const std::uint64_t retention_days =
      doc.get_u64("history.retention_days", history.retention_days);
  if (retention_days > kMaxRetentionDays) {
    return common::Result<Config>::failure("history.retention_days must be at most " +
                                           std::to_string(kMaxRetentionDays));
  }
  history.retention_days = static_cast<std::uint32_t>(retention_days);

  auto &pricing = config.pricing;
  pricing.default_prompt_price_per_1k =
      doc.get_double("pricing.default_prompt_price_per_1k", pricing.default_prompt_price_per_1k);
  pricing.default_completion_price_per_1k = doc.get_double(
      "pricing.default_completion_price_per_1k", pricing.default_completion_price_per_1k);
  pricing.currency = doc.get_string("pricing.currency", pricing.currency);
  for (const auto &key : doc.section_keys("pricing")) {
    if (pricing_scalar_keys().contains(key)) {
      continue;
    }
    auto entry = parse_pricing_entry(key, doc);
    if (!entry.ok()) {
      return common::Result<Config>::failure(entry.error());
    }
    pricing.models.push_back(std::move(entry.value()));
  }

  auto &counter = config.token_counter;
  counter.chars_per_token = static_cast<std::uint32_t>(
      doc.get_u64("token_counter.chars_per_token", counter.chars_per_token));
  counter.message_overhead = static_cast<std::uint32_t>(
      doc.get_u64("token_counter.message_overhead", counter.message_overhead));
  counter.reply_overhead = static_cast<std::uint32_t>(
      doc.get_u64("token_counter.reply_overhead", counter.reply_overhead));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto loaded = load_config_from(path);
  if (!loaded.ok()) {
    return loaded;
  }
  apply_env_overrides(loaded.value());
  return loaded;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.history.queue_capacity == 0) {
    return Warnings::failure("history.queue_capacity must be positive");
  }
  if (config.history.worker_count == 0) {
    return Warnings::failure("history.worker_count must be positive");
  }
  if (config.token_counter.chars_per_token == 0) {
    return Warnings::failure("token_counter.chars_per_token must be positive");
  }
  if (config.pricing.default_prompt_price_per_1k < 0.0 ||
      config.pricing.default_completion_price_per_1k < 0.0) {
    return Warnings::failure("pricing defaults must not be negative");
  }
  if (common::trim(config.pricing.currency).empty()) {
    return Warnings::failure("pricing.currency must not be empty");
  }

  for (const auto &entry : config.pricing.models) {
    const std::string key = entry.provider + ":" + entry.model;
    if (entry.prompt_price_per_1k < 0.0 || entry.completion_price_per_1k < 0.0) {
      return Warnings::failure("pricing." + key + " has a negative price");
    }
    if (common::trim(entry.currency).empty()) {
      return Warnings::failure("pricing." + key + " has an empty currency");
    }
    if (entry.currency != config.pricing.currency) {
      warnings.push_back("pricing." + key + " uses " + entry.currency +
                         " while the default currency is " + config.pricing.currency);
    }
  }

  if (config.history.worker_count > 1) {
    warnings.push_back("history.worker_count > 1 does not preserve write order across sessions");
  }
  if (config.history.pending_ttl_seconds == 0) {
    warnings.push_back("history.pending_ttl_seconds = 0 drops every pending request on the "
                       "next call");
  }
  if (config.history.retention_days > kMaxRetentionDays) {
    return Warnings::failure("history.retention_days must be at most " +
                             std::to_string(kMaxRetentionDays));
  }
  if (config.history.retention_days == 0) {
    warnings.push_back("history.retention_days = 0 makes cleanup remove everything");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop" &&
      backend.find(',') == std::string::npos) {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', using log");
  }

  return Warnings::success(std::move(warnings));
}

common::Result<std::filesystem::path> resolve_history_dir(const Config &config) {
  if (!common::trim(config.history.base_dir).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.history.base_dir)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / HISTORY_FOLDER);
}

} // namespace chronicle::config
