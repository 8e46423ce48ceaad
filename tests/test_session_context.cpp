#include "test_framework.hpp"

#include "chronicle/history/session_context.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

void register_session_context_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  namespace h = chronicle::history;

  tests.push_back({"session_context_empty_by_default", [] {
                     require(!h::get_current().has_value(), "no session expected");
                     require(h::current_depth() == 0, "empty stack");
                     h::clear_current();
                     require(h::current_depth() == 0, "clear on empty is a no-op");
                   }});

  tests.push_back({"session_context_nested_scopes_restore_outer", [] {
                     {
                       h::SessionScope outer("A");
                       require(h::get_current() == std::optional<std::string>("A"), "outer");
                       {
                         h::SessionScope inner("B");
                         require(h::get_current() == std::optional<std::string>("B"), "inner");
                       }
                       require(h::get_current() == std::optional<std::string>("A"),
                               "outer restored");
                     }
                     require(!h::get_current().has_value(), "nothing after both scopes");
                   }});

  tests.push_back({"session_context_scope_unwinds_on_exception", [] {
                     h::SessionScope outer("A");
                     try {
                       h::SessionScope inner("B");
                       throw std::runtime_error("boom");
                     } catch (const std::runtime_error &) {
                     }
                     require(h::get_current() == std::optional<std::string>("A"),
                             "exception must not leak the inner session");
                   }});

  tests.push_back({"session_context_scope_discards_unbalanced_pushes", [] {
                     {
                       h::SessionScope scope("A");
                       h::set_current("stray");
                       h::set_current("stray-2");
                     }
                     require(h::current_depth() == 0, "scope exit trims to entry depth");
                   }});

  tests.push_back({"session_context_set_and_clear_stack", [] {
                     h::set_current("one");
                     h::set_current("two");
                     require(h::get_current() == std::optional<std::string>("two"), "top");
                     h::clear_current();
                     require(h::get_current() == std::optional<std::string>("one"), "popped");
                     h::clear_current();
                     require(!h::get_current().has_value(), "empty again");
                   }});

  tests.push_back({"session_context_is_per_thread", [] {
                     h::SessionScope scope("main-thread");
                     std::optional<std::string> seen_in_worker = std::string("unset");
                     std::thread worker([&]() {
                       seen_in_worker = h::get_current();
                       h::SessionScope local("worker");
                     });
                     worker.join();
                     require(!seen_in_worker.has_value(), "worker must not see main's session");
                     require(h::get_current() == std::optional<std::string>("main-thread"),
                             "worker scope must not affect main");
                   }});

  tests.push_back({"session_context_resolve_prefers_explicit_id", [] {
                     require(!h::resolve_session("").has_value(), "nothing to resolve");
                     h::SessionScope scope("ctx");
                     require(h::resolve_session("") == std::optional<std::string>("ctx"),
                             "falls back to context");
                     require(h::resolve_session("explicit") ==
                                 std::optional<std::string>("explicit"),
                             "explicit wins");
                   }});
}
