#include "bench_common.hpp"

#include "chronicle/llm/token_counter.hpp"

#include <string>
#include <vector>

void run_token_benchmark() {
  chronicle::llm::HeuristicTokenCounter counter;
  std::vector<chronicle::llm::ChatMessage> messages;
  for (int i = 0; i < 20; ++i) {
    messages.push_back({.role = i % 2 == 0 ? "user" : "assistant",
                        .content = std::string(400, 'x')});
  }
  chronicle::bench::run_bench("token_count_messages", 5000,
                              [&] { (void)counter.count_messages_tokens(messages); });
}
