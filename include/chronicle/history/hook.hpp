#pragma once

#include "chronicle/history/cost_calculator.hpp"
#include "chronicle/history/record.hpp"
#include "chronicle/history/storage.hpp"
#include "chronicle/history/token_tracker.hpp"
#include "chronicle/history/write_queue.hpp"
#include "chronicle/llm/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronicle::history {

using Parameters = Metadata;

/// Lifecycle points around one outbound LLM call. Implementations must not throw
/// into the caller and must not alter the call's outcome.
class ILlmCallHook {
public:
  virtual ~ILlmCallHook() = default;

  /// Returns the request id that correlates the later after_call / on_error.
  virtual std::string before_call(const std::vector<llm::ChatMessage> &messages,
                                  const Parameters &parameters, const std::string &session_id,
                                  const std::string &model, const std::string &provider,
                                  const std::optional<std::string> &request_id = std::nullopt) = 0;
  virtual void after_call(const llm::LlmResponse &response,
                          const std::vector<llm::ChatMessage> &messages,
                          const Parameters &parameters, const std::string &request_id) = 0;
  virtual void on_error(const llm::LlmError &error, const std::vector<llm::ChatMessage> &messages,
                        const Parameters &parameters, const std::string &request_id) = 0;
};

struct HookOptions {
  /// Pending requests older than this are discarded on the next before_call.
  std::chrono::seconds pending_ttl{3600};
};

/// Persists request, response, usage and cost records for each call through
/// the write queue.
class HistoryRecordingHook final : public ILlmCallHook {
public:
  HistoryRecordingHook(std::shared_ptr<IHistoryStorage> storage,
                       std::shared_ptr<TokenUsageTracker> tracker,
                       std::shared_ptr<CostCalculator> calculator,
                       std::shared_ptr<WriteQueue> queue, HookOptions options = {},
                       Clock clock = common::now_timestamp);

  std::string before_call(const std::vector<llm::ChatMessage> &messages,
                          const Parameters &parameters, const std::string &session_id,
                          const std::string &model, const std::string &provider,
                          const std::optional<std::string> &request_id = std::nullopt) override;
  void after_call(const llm::LlmResponse &response, const std::vector<llm::ChatMessage> &messages,
                  const Parameters &parameters, const std::string &request_id) override;
  void on_error(const llm::LlmError &error, const std::vector<llm::ChatMessage> &messages,
                const Parameters &parameters, const std::string &request_id) override;

  [[nodiscard]] std::size_t pending_count() const;

private:
  struct PendingRequest {
    LlmRequestRecord request;
    std::chrono::steady_clock::time_point started;
  };

  [[nodiscard]] std::optional<PendingRequest> take_pending(const std::string &request_id);
  void sweep_expired();
  void persist(std::vector<HistoryRecord> records, const std::string &label);

  std::shared_ptr<IHistoryStorage> storage_;
  std::shared_ptr<TokenUsageTracker> tracker_;
  std::shared_ptr<CostCalculator> calculator_;
  std::shared_ptr<WriteQueue> queue_;
  HookOptions options_;
  Clock clock_;
  mutable std::mutex pending_mutex_;
  std::unordered_map<std::string, PendingRequest> pending_;
};

/// Forwards each lifecycle point to every child under one shared request id. A
/// failing child does not stop the others.
class CompositeHook final : public ILlmCallHook {
public:
  void add(std::shared_ptr<ILlmCallHook> hook);
  [[nodiscard]] std::size_t size() const { return hooks_.size(); }

  std::string before_call(const std::vector<llm::ChatMessage> &messages,
                          const Parameters &parameters, const std::string &session_id,
                          const std::string &model, const std::string &provider,
                          const std::optional<std::string> &request_id = std::nullopt) override;
  void after_call(const llm::LlmResponse &response, const std::vector<llm::ChatMessage> &messages,
                  const Parameters &parameters, const std::string &request_id) override;
  void on_error(const llm::LlmError &error, const std::vector<llm::ChatMessage> &messages,
                const Parameters &parameters, const std::string &request_id) override;

private:
  std::vector<std::shared_ptr<ILlmCallHook>> hooks_;
};

} // namespace chronicle::history
