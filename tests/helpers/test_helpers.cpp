#include "tests/helpers/test_helpers.hpp"

#include "chronicle/common/id.hpp"
#include "chronicle/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace chronicle::testing {

TempWorkspace::TempWorkspace() {
  path_ = std::filesystem::temp_directory_path() /
          ("chronicle-test-workspace-" + common::random_hex(8));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ManualClock::ManualClock(const common::Timestamp start)
    : micros_(std::make_shared<std::atomic<std::int64_t>>(start.time_since_epoch().count())) {}

history::Clock ManualClock::clock() const {
  auto micros = micros_;
  return [micros]() { return common::Timestamp(std::chrono::microseconds(micros->load())); };
}

common::Timestamp ManualClock::now() const {
  return common::Timestamp(std::chrono::microseconds(micros_->load()));
}

void ManualClock::set(const common::Timestamp value) {
  micros_->store(value.time_since_epoch().count());
}

void ManualClock::advance(const std::chrono::microseconds delta) { *micros_ += delta.count(); }

std::optional<std::uint64_t>
FixedTokenCounter::count_messages_tokens(const std::vector<llm::ChatMessage> &) {
  ++calls_;
  return value_;
}

std::optional<std::uint64_t>
ThrowingTokenCounter::count_messages_tokens(const std::vector<llm::ChatMessage> &) {
  throw std::runtime_error("tokenizer unavailable");
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ErrorEvent> CapturingObserver::errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<observability::ErrorEvent> out;
  for (const auto &event : events_) {
    if (const auto *error = std::get_if<observability::ErrorEvent>(&event); error != nullptr) {
      out.push_back(*error);
    }
  }
  return out;
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CapturingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverGuard::ObserverGuard() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverGuard::~ObserverGuard() { observability::set_global_observer(nullptr); }

bool FailingStorage::store(const history::HistoryRecord &) {
  ++attempts_;
  return false;
}

std::vector<history::RawRecord> FailingStorage::read_all(const std::string &) { return {}; }

std::size_t FailingStorage::cleanup(common::Timestamp) { return 0; }

std::size_t FailingStorage::count_before(common::Timestamp) { return 0; }

common::Timestamp at(const std::string &iso) {
  const auto parsed = common::parse_iso8601(iso);
  if (!parsed.has_value()) {
    throw std::runtime_error("bad timestamp literal: " + iso);
  }
  return *parsed;
}

std::vector<std::string> read_lines(const std::filesystem::path &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

history::MessageRecord make_message(const std::string &session_id, const std::string &content,
                                    const common::Timestamp timestamp) {
  history::MessageRecord record;
  record.record_id = common::generate_id();
  record.session_id = session_id;
  record.timestamp = timestamp;
  record.message_type = history::MessageType::User;
  record.content = content;
  return record;
}

history::TokenUsageRecord make_usage(const std::string &session_id, const std::string &model,
                                     const std::uint64_t prompt_tokens,
                                     const std::uint64_t completion_tokens,
                                     const common::Timestamp timestamp) {
  history::TokenUsageRecord record;
  record.record_id = common::generate_id();
  record.session_id = session_id;
  record.timestamp = timestamp;
  record.model = model;
  record.provider = "openai";
  record.prompt_tokens = prompt_tokens;
  record.completion_tokens = completion_tokens;
  record.total_tokens = prompt_tokens + completion_tokens;
  record.source = history::TokenSource::Api;
  record.confidence = 1.0;
  return record;
}

} // namespace chronicle::testing
