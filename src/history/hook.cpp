#include "chronicle/history/hook.hpp"

#include "chronicle/common/id.hpp"
#include "chronicle/history/session_context.hpp"
#include "chronicle/observability/global.hpp"

namespace chronicle::history {

namespace {

constexpr const char *COMPONENT = "history.hook";

double seconds_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

std::chrono::milliseconds to_millis(const double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

} // namespace

HistoryRecordingHook::HistoryRecordingHook(std::shared_ptr<IHistoryStorage> storage,
                                           std::shared_ptr<TokenUsageTracker> tracker,
                                           std::shared_ptr<CostCalculator> calculator,
                                           std::shared_ptr<WriteQueue> queue, HookOptions options,
                                           Clock clock)
    : storage_(std::move(storage)), tracker_(std::move(tracker)),
      calculator_(std::move(calculator)), queue_(std::move(queue)), options_(options),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::now_timestamp;
  }
}

std::size_t HistoryRecordingHook::pending_count() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

void HistoryRecordingHook::sweep_expired() {
  std::size_t swept = 0;
  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    const auto now = std::chrono::steady_clock::now();
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (now - it->second.started > options_.pending_ttl) {
        it = pending_.erase(it);
        ++swept;
      } else {
        ++it;
      }
    }
    remaining = pending_.size();
  }
  if (swept > 0) {
    observability::record_debug(COMPONENT, "discarded " + std::to_string(swept) +
                                               " expired pending request(s)");
    observability::record_metric(observability::PendingRequestsMetric{.count = remaining});
  }
}

std::optional<HistoryRecordingHook::PendingRequest>
HistoryRecordingHook::take_pending(const std::string &request_id) {
  std::optional<PendingRequest> out;
  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    const auto it = pending_.find(request_id);
    if (it == pending_.end()) {
      return std::nullopt;
    }
    out = std::move(it->second);
    pending_.erase(it);
    remaining = pending_.size();
  }
  observability::record_metric(observability::PendingRequestsMetric{.count = remaining});
  return out;
}

void HistoryRecordingHook::persist(std::vector<HistoryRecord> records, const std::string &label) {
  auto job = [storage = storage_, records = std::move(records)]() {
    for (const auto &record : records) {
      (void)storage->store(record);
    }
  };
  if (queue_ == nullptr) {
    job();
    return;
  }
  (void)queue_->submit(std::move(job), label);
}

std::string HistoryRecordingHook::before_call(const std::vector<llm::ChatMessage> &messages,
                                              const Parameters &parameters,
                                              const std::string &session_id,
                                              const std::string &model,
                                              const std::string &provider,
                                              const std::optional<std::string> &request_id) {
  const std::string id =
      request_id.has_value() && !request_id->empty() ? *request_id : common::generate_id();
  try {
    sweep_expired();

    const auto session = resolve_session(session_id);
    if (!session.has_value()) {
      observability::record_debug(COMPONENT, "no session for request " + id + ", not recorded");
      return id;
    }

    LlmRequestRecord request;
    request.record_id = id;
    request.session_id = *session;
    request.timestamp = clock_();
    request.model = model;
    request.provider = provider;
    request.messages = messages;
    request.parameters = parameters;
    if (tracker_ != nullptr) {
      request.estimated_tokens = tracker_->estimate_tokens(messages);
    }

    std::size_t pending = 0;
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      pending_[id] =
          PendingRequest{.request = request, .started = std::chrono::steady_clock::now()};
      pending = pending_.size();
    }
    observability::record_metric(observability::PendingRequestsMetric{.count = pending});

    persist({HistoryRecord(std::move(request))}, "llm_request");
  } catch (const std::exception &ex) {
    observability::record_error(COMPONENT, "before_call failed for " + id + ": " + ex.what());
  }
  return id;
}

void HistoryRecordingHook::after_call(const llm::LlmResponse &response,
                                      const std::vector<llm::ChatMessage> &messages,
                                      const Parameters &parameters,
                                      const std::string &request_id) {
  (void)messages;
  (void)parameters;
  try {
    auto pending = take_pending(request_id);
    if (!pending.has_value()) {
      return;
    }
    const LlmRequestRecord &request = pending->request;
    const auto now = clock_();
    const double response_time = response.response_time.value_or(seconds_since(pending->started));

    LlmResponseRecord reply;
    reply.record_id = common::generate_id();
    reply.session_id = request.session_id;
    reply.timestamp = now;
    reply.request_id = request_id;
    reply.content = response.content;
    reply.finish_reason = response.finish_reason;
    reply.response_time = response_time;
    reply.model = response.model.empty() ? request.model : response.model;
    reply.metadata = response.metadata;

    TokenUsageRecord usage;
    usage.record_id = common::generate_id();
    usage.session_id = request.session_id;
    usage.timestamp = now;
    usage.model = reply.model;
    usage.provider = request.provider;
    usage.metadata["request_id"] = request_id;

    std::optional<llm::TokenUsage> reported = response.usage;
    if (!reported.has_value() && !response.raw_payload.empty()) {
      reported = extract_usage(response.raw_payload);
    }
    if (reported.has_value()) {
      usage.prompt_tokens = reported->prompt_tokens;
      usage.completion_tokens = reported->completion_tokens;
      usage.total_tokens = reported->total_tokens;
    } else {
      // Provider reported nothing: the counts are the pre-call estimate.
      usage.prompt_tokens = request.estimated_tokens.value_or(0);
      usage.total_tokens = usage.prompt_tokens;
      usage.metadata["usage_reported"] = common::JsonValue::raw("false");
    }
    // The completed call finalizes the line whatever the payload carried.
    usage.source = TokenSource::Api;
    usage.confidence = kApiConfidence;
    reply.token_usage = llm::TokenUsage{.prompt_tokens = usage.prompt_tokens,
                                        .completion_tokens = usage.completion_tokens,
                                        .total_tokens = usage.total_tokens};

    observability::record_llm_call(request.provider, reply.model, to_millis(response_time), true);

    auto job = [storage = storage_, calculator = calculator_, reply = std::move(reply),
                usage = std::move(usage)]() {
      (void)storage->store(reply);
      (void)storage->store(usage);
      observability::record_metric(observability::TokensUsedMetric{.tokens = usage.total_tokens});
      if (calculator == nullptr) {
        return;
      }
      const CostRecord cost = calculator->calculate_cost(usage);
      (void)storage->store(cost);
      observability::record_metric(
          observability::CostMetric{.amount = cost.total_cost, .currency = cost.currency});
    };
    if (queue_ == nullptr) {
      job();
    } else {
      (void)queue_->submit(std::move(job), "llm_response");
    }
  } catch (const std::exception &ex) {
    observability::record_error(COMPONENT,
                                "after_call failed for " + request_id + ": " + ex.what());
  }
}

void HistoryRecordingHook::on_error(const llm::LlmError &error,
                                    const std::vector<llm::ChatMessage> &messages,
                                    const Parameters &parameters, const std::string &request_id) {
  (void)messages;
  (void)parameters;
  try {
    LlmResponseRecord reply;
    std::string provider;
    double response_time = 0.0;

    if (auto pending = take_pending(request_id); pending.has_value()) {
      reply.session_id = pending->request.session_id;
      reply.model = pending->request.model;
      provider = pending->request.provider;
      response_time = seconds_since(pending->started);
    } else if (const auto current = get_current(); current.has_value()) {
      reply.session_id = *current;
    } else {
      observability::record_debug(COMPONENT,
                                  "no session for failed request " + request_id + ", not recorded");
      return;
    }

    reply.record_id = common::generate_id();
    reply.timestamp = clock_();
    reply.request_id = request_id;
    reply.content = error.message;
    reply.finish_reason = "error";
    reply.response_time = response_time;
    reply.metadata["error"] = error.message;
    reply.metadata["error_kind"] = llm::to_string(error.kind);

    observability::record_llm_call(provider, reply.model, to_millis(response_time), false);
    persist({HistoryRecord(std::move(reply))}, "llm_error");
  } catch (const std::exception &ex) {
    observability::record_error(COMPONENT, "on_error failed for " + request_id + ": " + ex.what());
  }
}

void CompositeHook::add(std::shared_ptr<ILlmCallHook> hook) {
  if (hook != nullptr) {
    hooks_.push_back(std::move(hook));
  }
}

std::string CompositeHook::before_call(const std::vector<llm::ChatMessage> &messages,
                                       const Parameters &parameters,
                                       const std::string &session_id, const std::string &model,
                                       const std::string &provider,
                                       const std::optional<std::string> &request_id) {
  std::optional<std::string> id = request_id;
  if (!id.has_value() || id->empty()) {
    id = common::generate_id();
  }
  for (const auto &hook : hooks_) {
    try {
      (void)hook->before_call(messages, parameters, session_id, model, provider, id);
    } catch (const std::exception &ex) {
      observability::record_error(COMPONENT, std::string("before_call hook failed: ") + ex.what());
    }
  }
  return *id;
}

void CompositeHook::after_call(const llm::LlmResponse &response,
                               const std::vector<llm::ChatMessage> &messages,
                               const Parameters &parameters, const std::string &request_id) {
  for (const auto &hook : hooks_) {
    try {
      hook->after_call(response, messages, parameters, request_id);
    } catch (const std::exception &ex) {
      observability::record_error(COMPONENT, std::string("after_call hook failed: ") + ex.what());
    }
  }
}

void CompositeHook::on_error(const llm::LlmError &error,
                             const std::vector<llm::ChatMessage> &messages,
                             const Parameters &parameters, const std::string &request_id) {
  for (const auto &hook : hooks_) {
    try {
      hook->on_error(error, messages, parameters, request_id);
    } catch (const std::exception &ex) {
      observability::record_error(COMPONENT, std::string("on_error hook failed: ") + ex.what());
    }
  }
}

} // namespace chronicle::history
