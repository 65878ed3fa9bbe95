#pragma once

#include <ordmap/macros.hh>

#include <source_location>

// =========================================================================================================
// Assertions
//
// OM_ASSERT(cond, msg)        checked while OM_ASSERT_ENABLED, otherwise compiled but not evaluated
// OM_ASSERT_ALWAYS(cond, msg) checked in every build mode
//
// A failed assertion calls the topmost handler from assert-handler.hh (stderr by default),
// then breaks into an attached debugger and aborts. A handler may throw to skip the abort.
//
// Assertions are for programmer errors only:
//   - reading an om::value as the wrong kind
//   - name() of an identity key
//   - calling an empty om::function_ref
// Keys coming from the outside are validated with exceptions (map_error.hh),
// and misses during lookup are not errors at all (falsy(), try_get, optional).
//
// Usage:
//   OM_ASSERT(is_string(), "map_key::name() requires a string key");
// =========================================================================================================

#define OM_ASSERT_ALWAYS(cond, msg)                                                             \
    do                                                                                          \
    {                                                                                           \
        if (!(cond)) [[unlikely]]                                                               \
        {                                                                                       \
            ::om::impl::handle_assert_failure(#cond, msg, std::source_location::current());    \
            OM_DEBUG_BREAK();                                                                   \
            ::om::impl::perform_abort();                                                        \
        }                                                                                       \
    } while (false)

#if OM_ASSERT_ENABLED
#define OM_ASSERT(cond, msg) OM_ASSERT_ALWAYS(cond, msg)
#else
#define OM_ASSERT(cond, msg) \
    do                       \
    {                        \
        OM_UNUSED(cond);     \
        OM_UNUSED(msg);      \
    } while (false)
#endif

// breaks only if a debugger is attached
// must expand in place so the debugger stops at the failing assertion
#if defined(OM_COMPILER_MSVC)
#define OM_DEBUG_BREAK() (::om::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// 5 is SIGTRAP, declared here to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define OM_DEBUG_BREAK() (::om::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

namespace om::impl
{
// dispatches to the topmost assertion handler, returns if the handler does
OM_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace om::impl
