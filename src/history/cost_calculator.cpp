#include "chronicle/history/cost_calculator.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/id.hpp"

namespace chronicle::history {

namespace {

double tokens_cost(const std::uint64_t tokens, const double price_per_1k) {
  return static_cast<double>(tokens) / 1000.0 * price_per_1k;
}

} // namespace

std::string pricing_key(const std::string &provider, const std::string &model) {
  return provider + ":" + model;
}

PricingTable builtin_pricing() {
  const auto price = [](const double prompt, const double completion) {
    return ModelPricing{.prompt_price_per_1k = prompt, .completion_price_per_1k = completion};
  };
  return PricingTable{
      {"openai:gpt-4", price(0.03, 0.06)},
      {"openai:gpt-4-32k", price(0.06, 0.12)},
      {"openai:gpt-4-turbo", price(0.01, 0.03)},
      {"openai:gpt-4-turbo-preview", price(0.01, 0.03)},
      {"openai:gpt-3.5-turbo", price(0.0015, 0.002)},
      {"openai:gpt-3.5-turbo-16k", price(0.003, 0.004)},
      {"openai:gpt-3.5-turbo-instruct", price(0.0015, 0.002)},
      {"openai:text-davinci-003", price(0.02, 0.02)},
      {"openai:text-curie-001", price(0.002, 0.002)},
      {"google:gemini-pro", price(0.0005, 0.0015)},
      {"google:gemini-pro-vision", price(0.0025, 0.0075)},
      {"google:gemini-1.5-pro", price(0.0025, 0.0075)},
      {"google:gemini-1.5-flash", price(0.00015, 0.0006)},
      {"anthropic:claude-3-opus-20240229", price(0.015, 0.075)},
      {"anthropic:claude-3-sonnet-20240229", price(0.003, 0.015)},
      {"anthropic:claude-3-haiku-20240307", price(0.00025, 0.00125)},
      {"anthropic:claude-2.1", price(0.008, 0.024)},
      {"anthropic:claude-2.0", price(0.008, 0.024)},
      {"anthropic:claude-instant-1.2", price(0.0008, 0.0024)},
  };
}

CostCalculator::CostCalculator() : CostCalculator(builtin_pricing()) {}

CostCalculator::CostCalculator(PricingTable pricing, const double default_prompt_price_per_1k,
                               const double default_completion_price_per_1k,
                               std::string currency)
    : pricing_(std::move(pricing)), default_prompt_price_per_1k_(default_prompt_price_per_1k),
      default_completion_price_per_1k_(default_completion_price_per_1k),
      currency_(std::move(currency)) {
  if (currency_.empty()) {
    currency_ = "USD";
  }
}

CostEstimate CostCalculator::estimate_cost(const std::string &provider, const std::string &model,
                                           const std::uint64_t prompt_tokens,
                                           const std::uint64_t completion_tokens) const {
  CostEstimate estimate;
  double prompt_price = default_prompt_price_per_1k_;
  double completion_price = default_completion_price_per_1k_;
  estimate.currency = currency_;
  estimate.default_pricing = true;

  if (const auto pricing = get_pricing(provider, model); pricing.has_value()) {
    prompt_price = pricing->prompt_price_per_1k;
    completion_price = pricing->completion_price_per_1k;
    if (pricing->currency.has_value() && !pricing->currency->empty()) {
      estimate.currency = *pricing->currency;
    }
    estimate.default_pricing = false;
  }

  estimate.prompt_cost = tokens_cost(prompt_tokens, prompt_price);
  estimate.completion_cost = tokens_cost(completion_tokens, completion_price);
  estimate.total_cost = estimate.prompt_cost + estimate.completion_cost;
  return estimate;
}

CostRecord CostCalculator::calculate_cost(const TokenUsageRecord &usage) const {
  const auto estimate =
      estimate_cost(usage.provider, usage.model, usage.prompt_tokens, usage.completion_tokens);

  CostRecord record;
  record.record_id = common::generate_id();
  record.session_id = usage.session_id;
  record.timestamp = usage.timestamp;
  record.model = usage.model;
  record.provider = usage.provider;
  record.prompt_tokens = usage.prompt_tokens;
  record.completion_tokens = usage.completion_tokens;
  record.total_tokens = usage.total_tokens;
  record.prompt_cost = estimate.prompt_cost;
  record.completion_cost = estimate.completion_cost;
  record.total_cost = estimate.total_cost;
  record.currency = estimate.currency;
  record.metadata["token_usage_record_id"] = usage.record_id;
  if (estimate.default_pricing) {
    record.metadata["pricing"] = "default";
  }
  return record;
}

common::Status CostCalculator::update_pricing(const std::string &provider,
                                              const std::string &model, ModelPricing pricing) {
  if (common::trim(provider).empty() || common::trim(model).empty()) {
    return common::Status::error("provider and model are required");
  }
  if (pricing.prompt_price_per_1k < 0.0 || pricing.completion_price_per_1k < 0.0) {
    return common::Status::error("prices must not be negative");
  }
  if (pricing.currency.has_value() && common::trim(*pricing.currency).empty()) {
    return common::Status::error("currency must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  pricing_[pricing_key(provider, model)] = std::move(pricing);
  return common::Status::success();
}

std::optional<ModelPricing> CostCalculator::get_pricing(const std::string &provider,
                                                        const std::string &model) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pricing_.find(pricing_key(provider, model));
  if (it == pricing_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool CostCalculator::has_pricing(const std::string &provider, const std::string &model) const {
  return get_pricing(provider, model).has_value();
}

std::vector<std::string> CostCalculator::list_models(const std::string &provider) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  const std::string prefix = provider + ":";
  for (const auto &[key, pricing] : pricing_) {
    (void)pricing;
    if (provider.empty()) {
      out.push_back(key);
    } else if (common::starts_with(key, prefix)) {
      out.push_back(key.substr(prefix.size()));
    }
  }
  return out;
}

std::unique_ptr<CostCalculator> create_cost_calculator(const config::PricingConfig &config) {
  PricingTable table = builtin_pricing();
  for (const auto &entry : config.models) {
    table[pricing_key(entry.provider, entry.model)] =
        ModelPricing{.prompt_price_per_1k = entry.prompt_price_per_1k,
                     .completion_price_per_1k = entry.completion_price_per_1k,
                     .currency = entry.currency};
  }
  return std::make_unique<CostCalculator>(std::move(table), config.default_prompt_price_per_1k,
                                          config.default_completion_price_per_1k,
                                          config.currency);
}

} // namespace chronicle::history
