#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace chronicle::history {

/// Per-thread stack of active session ids. Nothing here is shared between threads;
/// background writers capture the session when work is enqueued.
void set_current(const std::string &session_id);
[[nodiscard]] std::optional<std::string> get_current();
/// Pops one entry; no-op on an empty stack.
void clear_current();
[[nodiscard]] std::size_t current_depth();

/// `explicit_id` when non-empty, otherwise the current session.
[[nodiscard]] std::optional<std::string> resolve_session(const std::string &explicit_id);

/// Pushes on construction. On destruction the stack is cut back to its depth at
/// entry, so whatever was current before the scope is current again.
class SessionScope {
public:
  explicit SessionScope(const std::string &session_id);
  ~SessionScope();

  SessionScope(const SessionScope &) = delete;
  SessionScope &operator=(const SessionScope &) = delete;

private:
  std::size_t entry_depth_;
};

} // namespace chronicle::history
