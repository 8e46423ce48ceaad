#include "chronicle/history/session_context.hpp"

#include <vector>

namespace chronicle::history {

namespace {

std::vector<std::string> &session_stack() {
  thread_local std::vector<std::string> stack;
  return stack;
}

} // namespace

void set_current(const std::string &session_id) { session_stack().push_back(session_id); }

std::optional<std::string> get_current() {
  const auto &stack = session_stack();
  if (stack.empty()) {
    return std::nullopt;
  }
  return stack.back();
}

void clear_current() {
  auto &stack = session_stack();
  if (!stack.empty()) {
    stack.pop_back();
  }
}

std::size_t current_depth() { return session_stack().size(); }

std::optional<std::string> resolve_session(const std::string &explicit_id) {
  if (!explicit_id.empty()) {
    return explicit_id;
  }
  return get_current();
}

SessionScope::SessionScope(const std::string &session_id) : entry_depth_(current_depth()) {
  set_current(session_id);
}

SessionScope::~SessionScope() {
  auto &stack = session_stack();
  if (stack.size() > entry_depth_) {
    stack.resize(entry_depth_);
  }
}

} // namespace chronicle::history
