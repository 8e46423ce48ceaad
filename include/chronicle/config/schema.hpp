#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chronicle::config {

/// Longest retention window accepted from config or the command line.
inline constexpr std::uint32_t kMaxRetentionDays = 36500;

struct HistoryConfig {
  /// Empty means `<config_dir>/history`.
  std::string base_dir;
  std::uint64_t queue_capacity = 1024;
  std::uint32_t worker_count = 1;
  std::uint64_t pending_ttl_seconds = 3600;
  std::uint32_t retention_days = 30;
};

struct ModelPricingEntry {
  std::string provider;
  std::string model;
  double prompt_price_per_1k = 0.0;
  double completion_price_per_1k = 0.0;
  std::string currency = "USD";
};

struct PricingConfig {
  double default_prompt_price_per_1k = 0.01;
  double default_completion_price_per_1k = 0.03;
  std::string currency = "USD";
  std::vector<ModelPricingEntry> models;
};

struct TokenCounterConfig {
  std::uint32_t chars_per_token = 4;
  std::uint32_t message_overhead = 4;
  std::uint32_t reply_overhead = 3;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  HistoryConfig history;
  PricingConfig pricing;
  TokenCounterConfig token_counter;
  ObservabilityConfig observability;
};

} // namespace chronicle::config
