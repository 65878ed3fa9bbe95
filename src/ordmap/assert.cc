#include "assert.hh"

#include <ordmap/assert-handler.hh>
#include <ordmap/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef OM_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<om::impl::assertion_handler> g_handlers;

#ifdef __linux__
// non-zero TracerPid in /proc/self/status means a debugger is attached
bool has_tracer()
{
    auto* const f = std::fopen("/proc/self/status", "r");
    if (f == nullptr)
        return false;

    auto traced = false;
    char line[256];
    while (std::fgets(line, sizeof(line), f) != nullptr)
    {
        if (std::strncmp(line, "TracerPid:", 10) != 0)
            continue;

        int pid = 0;
        traced = std::sscanf(line + 10, "%d", &pid) == 1 && pid != 0;
        break;
    }

    std::fclose(f);
    return traced;
}
#endif
} // namespace

std::string om::impl::format_assertion_report(assertion_info const& info)
{
    auto report = std::string("[ordmap] assertion failed: ") + info.expression + '\n';
    report += "  " + info.message + '\n';
    report += "  at " + std::string(info.location.file_name()) + ':' + std::to_string(info.location.line()) + " ("
            + info.location.function_name() + ")\n";

    report += "\nstacktrace:\n";
    report += std::to_string(om::stacktrace::current());
    report += '\n';
    return report;
}

void om::impl::push_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

void om::impl::pop_assertion_handler()
{
    OM_ASSERT_ALWAYS(!g_handlers.empty(), "unbalanced pop_assertion_handler");
    g_handlers.pop_back();
}

om::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

om::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void om::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        std::cerr << format_assertion_report(info);
    else
        g_handlers.back()(info);
}

bool om::impl::is_debugger_connected() noexcept
{
#if defined(OM_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(__linux__)
    return has_tracer();
#else
    return false;
#endif
}

void om::impl::perform_abort() noexcept
{
    std::abort();
}
