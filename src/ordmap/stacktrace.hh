#pragma once

#include <stacktrace>

namespace om
{
/// call stack snapshot, printed by the default assertion report
/// Usage:
///   std::cerr << std::to_string(om::stacktrace::current());
using stacktrace = std::stacktrace;
using stacktrace_entry = std::stacktrace_entry;
} // namespace om
