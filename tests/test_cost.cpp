#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "chronicle/config/schema.hpp"
#include "chronicle/history/cost_calculator.hpp"

#include <string>
#include <utility>
#include <vector>

void register_cost_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  using chronicle::tests::require_near;
  namespace h = chronicle::history;
  namespace t = chronicle::testing;

  tests.push_back({"cost_uses_per_thousand_model_pricing", [] {
                     h::PricingTable table;
                     table[h::pricing_key("openai", "gpt-4")] =
                         h::ModelPricing{.prompt_price_per_1k = 0.03,
                                         .completion_price_per_1k = 0.06};
                     h::CostCalculator calculator(std::move(table));
                     const auto usage =
                         t::make_usage("s1", "gpt-4", 2000, 500, t::at("2024-01-01T00:00:00Z"));
                     const auto cost = calculator.calculate_cost(usage);
                     require_near(cost.prompt_cost, 0.06, "prompt cost");
                     require_near(cost.completion_cost, 0.03, "completion cost");
                     require_near(cost.total_cost, cost.prompt_cost + cost.completion_cost,
                                  "total is the sum");
                     require(cost.metadata.count("pricing") == 0, "model pricing is not default");
                   }});

  tests.push_back({"cost_falls_back_to_default_pricing", [] {
                     h::CostCalculator calculator;
                     const auto usage =
                         t::make_usage("s1", "mystery", 1000, 1000, t::at("2024-01-01T00:00:00Z"));
                     const auto cost = calculator.calculate_cost(usage);
                     require_near(cost.prompt_cost, 0.01, "default prompt price");
                     require_near(cost.completion_cost, 0.03, "default completion price");
                     require_near(cost.total_cost, 0.04, "default total");
                     require(cost.currency == "USD", "default currency");
                     require(cost.metadata.at("pricing") == "default", "default pricing flagged");
                   }});

  tests.push_back({"cost_inherits_usage_identity", [] {
                     h::CostCalculator calculator;
                     const auto ts = t::at("2024-02-02T02:02:02Z");
                     const auto usage = t::make_usage("session-x", "m", 10, 20, ts);
                     const auto cost = calculator.calculate_cost(usage);
                     require(cost.session_id == "session-x", "session inherited");
                     require(cost.timestamp == ts, "timestamp inherited");
                     require(cost.model == "m" && cost.provider == "openai", "model and provider");
                     require(cost.prompt_tokens == 10 && cost.completion_tokens == 20 &&
                                 cost.total_tokens == 30,
                             "token counts copied");
                     require(cost.metadata.at("token_usage_record_id") == usage.record_id,
                             "usage link");
                     require(!cost.record_id.empty() && cost.record_id != usage.record_id,
                             "own record id");
                   }});

  tests.push_back({"cost_zero_tokens_costs_nothing", [] {
                     h::CostCalculator calculator;
                     const auto cost = calculator.calculate_cost(
                         t::make_usage("s", "m", 0, 0, t::at("2024-01-01T00:00:00Z")));
                     require(cost.total_cost == 0.0, "zero cost");
                   }});

  tests.push_back({"cost_model_currency_overrides_default", [] {
                     h::CostCalculator calculator({}, 0.01, 0.03, "USD");
                     require(calculator
                                 .update_pricing("mistral", "large",
                                                 h::ModelPricing{.prompt_price_per_1k = 0.002,
                                                                 .completion_price_per_1k = 0.006,
                                                                 .currency = "EUR"})
                                 .ok(),
                             "update pricing");
                     const auto estimate = calculator.estimate_cost("mistral", "large", 1000, 1000);
                     require(estimate.currency == "EUR", "model currency");
                     require(!estimate.default_pricing, "not default");
                     require_near(estimate.total_cost, 0.008, "estimate total");
                   }});

  tests.push_back({"cost_update_pricing_validates_input", [] {
                     h::CostCalculator calculator{h::PricingTable{}};
                     require(!calculator
                                  .update_pricing("openai", "gpt-4",
                                                  h::ModelPricing{.prompt_price_per_1k = -1.0})
                                  .ok(),
                             "negative price accepted");
                     require(!calculator.update_pricing("", "gpt-4", h::ModelPricing{}).ok(),
                             "empty provider accepted");
                     require(!calculator
                                  .update_pricing("openai", "gpt-4",
                                                  h::ModelPricing{.currency = std::string(" ")})
                                  .ok(),
                             "blank currency accepted");
                     require(!calculator.has_pricing("openai", "gpt-4"), "nothing stored");
                   }});

  tests.push_back({"cost_list_models_by_provider", [] {
                     h::CostCalculator calculator{h::PricingTable{}};
                     (void)calculator.update_pricing("openai", "gpt-4", h::ModelPricing{});
                     (void)calculator.update_pricing("openai", "gpt-3.5", h::ModelPricing{});
                     (void)calculator.update_pricing("anthropic", "claude", h::ModelPricing{});
                     require(calculator.list_models("openai") ==
                                 std::vector<std::string>({"gpt-3.5", "gpt-4"}),
                             "provider models sorted");
                     require(calculator.list_models().size() == 3, "all keys");
                     require(calculator.list_models("unknown").empty(), "unknown provider");
                     const auto pricing = calculator.get_pricing("anthropic", "claude");
                     require(pricing.has_value(), "get pricing");
                   }});

  tests.push_back({"cost_calculator_from_config", [] {
                     chronicle::config::PricingConfig config;
                     config.default_prompt_price_per_1k = 0.5;
                     config.default_completion_price_per_1k = 1.5;
                     config.currency = "GBP";
                     config.models.push_back({.provider = "openai",
                                              .model = "gpt-4",
                                              .prompt_price_per_1k = 0.03,
                                              .completion_price_per_1k = 0.06,
                                              .currency = "USD"});
                     const auto calculator = h::create_cost_calculator(config);
                     require(calculator->currency() == "GBP", "currency");
                     require(calculator->has_pricing("openai", "gpt-4"), "model loaded");

                     const auto fallback = calculator->estimate_cost("x", "y", 1000, 1000);
                     require(fallback.default_pricing, "default pricing");
                     require(fallback.currency == "GBP", "default currency");
                     require_near(fallback.total_cost, 2.0, "configured defaults");
                   }});

  tests.push_back({"cost_default_calculator_knows_published_models", [] {
                     h::CostCalculator calculator;
                     const auto gpt4 = calculator.estimate_cost("openai", "gpt-4", 1000, 1000);
                     require(!gpt4.default_pricing, "gpt-4 is priced");
                     require_near(gpt4.prompt_cost, 0.03, "gpt-4 prompt price");
                     require_near(gpt4.completion_cost, 0.06, "gpt-4 completion price");

                     const auto haiku = calculator.get_pricing("anthropic", "claude-3-haiku-20240307");
                     require(haiku.has_value(), "claude haiku priced");
                     require_near(haiku->completion_price_per_1k, 0.00125, "haiku completion");
                     require(calculator.has_pricing("google", "gemini-1.5-flash"), "gemini flash");
                     require(calculator.list_models("openai").size() == 9, "openai catalogue");
                     require(calculator.list_models().size() == h::builtin_pricing().size(),
                             "every built-in model listed");
                   }});

  tests.push_back({"cost_config_overrides_builtin_prices", [] {
                     chronicle::config::PricingConfig config;
                     config.models.push_back({.provider = "openai",
                                              .model = "gpt-4",
                                              .prompt_price_per_1k = 0.5,
                                              .completion_price_per_1k = 0.25});
                     const auto calculator = h::create_cost_calculator(config);
                     const auto pricing = calculator->get_pricing("openai", "gpt-4");
                     require(pricing.has_value(), "gpt-4 priced");
                     require_near(pricing->prompt_price_per_1k, 0.5, "config prompt price wins");
                     require_near(pricing->completion_price_per_1k, 0.25,
                                  "config completion price wins");
                     require(calculator->has_pricing("google", "gemini-pro"),
                             "other built-ins kept");
                   }});
}
