#pragma once

#include <functional>
#include <source_location>
#include <string>

namespace om::impl
{
/// what a failed OM_ASSERT / OM_ASSERT_ALWAYS reports
struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// expression, message, location and the current stacktrace
/// this is what the default handler prints to stderr when no handler is pushed
[[nodiscard]] std::string format_assertion_report(assertion_info const& info);

// Handlers form a stack, only the topmost one is called.
// Without any handler the failure is printed to stderr.
// A handler that throws unwinds past the abort, which is how tests observe assertions.
// NOTE: global state, not synchronized
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// pushes a handler for the lifetime of the object
///
/// Usage:
///   {
///       auto const guard = om::impl::scoped_assertion_handler([](om::impl::assertion_info const& info) {
///           throw std::logic_error(info.message);
///       });
///       auto const n = m.get("name").as_integer(); // throws instead of aborting if "name" is not an integer
///   }
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace om::impl
