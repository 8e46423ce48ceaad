#pragma once

#include "chronicle/common/result.hpp"
#include "chronicle/config/schema.hpp"
#include "chronicle/history/record.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::history {

inline constexpr double kDefaultPromptPricePer1k = 0.01;
inline constexpr double kDefaultCompletionPricePer1k = 0.03;

struct ModelPricing {
  double prompt_price_per_1k = 0.0;
  double completion_price_per_1k = 0.0;
  std::optional<std::string> currency;
};

struct CostEstimate {
  double prompt_cost = 0.0;
  double completion_cost = 0.0;
  double total_cost = 0.0;
  std::string currency = "USD";
  bool default_pricing = false;
};

/// Keyed "provider:model".
using PricingTable = std::map<std::string, ModelPricing>;

/// Published per-1k prices for the common OpenAI, Google and Anthropic models, in USD.
[[nodiscard]] PricingTable builtin_pricing();

class CostCalculator {
public:
  /// Seeded with builtin_pricing().
  CostCalculator();
  /// Prices exactly the models in `pricing`.
  explicit CostCalculator(PricingTable pricing,
                          double default_prompt_price_per_1k = kDefaultPromptPricePer1k,
                          double default_completion_price_per_1k = kDefaultCompletionPricePer1k,
                          std::string currency = "USD");

  /// Cost of `usage` at the model's price, or the defaults when the model is not
  /// priced. The result shares the usage record's session and timestamp.
  [[nodiscard]] CostRecord calculate_cost(const TokenUsageRecord &usage) const;

  [[nodiscard]] CostEstimate estimate_cost(const std::string &provider, const std::string &model,
                                           std::uint64_t prompt_tokens,
                                           std::uint64_t completion_tokens) const;

  [[nodiscard]] common::Status update_pricing(const std::string &provider,
                                              const std::string &model, ModelPricing pricing);
  [[nodiscard]] std::optional<ModelPricing> get_pricing(const std::string &provider,
                                                        const std::string &model) const;
  [[nodiscard]] bool has_pricing(const std::string &provider, const std::string &model) const;
  /// Models priced for `provider`, sorted; every "provider:model" key when empty.
  [[nodiscard]] std::vector<std::string> list_models(const std::string &provider = "") const;

  [[nodiscard]] const std::string &currency() const { return currency_; }

private:
  PricingTable pricing_;
  double default_prompt_price_per_1k_;
  double default_completion_price_per_1k_;
  std::string currency_;
  mutable std::mutex mutex_;
};

[[nodiscard]] std::string pricing_key(const std::string &provider, const std::string &model);

/// Built-in prices overlaid with the configured models; config wins on a shared key.
[[nodiscard]] std::unique_ptr<CostCalculator>
create_cost_calculator(const config::PricingConfig &config);

} // namespace chronicle::history
