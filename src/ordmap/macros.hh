#pragma once

// =========================================================================================================
// Toolchain
// =========================================================================================================
// Conditionally defined: OM_COMPILER_MSVC, OM_COMPILER_POSIX (gcc, clang, mingw)

#if defined(_MSC_VER)
#define OM_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__)
#define OM_COMPILER_POSIX
#else
#error "ordmap supports msvc, gcc and clang"
#endif

// missing and invalid keys are reported via exceptions (om::map_error)
#if defined(OM_COMPILER_MSVC) && !defined(_CPPUNWIND)
#error "ordmap requires C++ exceptions"
#elif defined(OM_COMPILER_POSIX) && !defined(__EXCEPTIONS)
#error "ordmap requires C++ exceptions"
#endif

// =========================================================================================================
// Build modes
// =========================================================================================================
// From CMake:  OM_DEBUG, OM_RELWITHDEBINFO, OM_RELEASE
// Optional:    OM_ENABLE_ASSERT_IN_RELEASE
// Defined:     OM_ASSERT_ENABLED (0 or 1)

#if defined(OM_RELEASE) && !defined(OM_ENABLE_ASSERT_IN_RELEASE)
#define OM_ASSERT_ENABLED 0
#else
// debug, relwithdebinfo, or no mode passed by the build system
#define OM_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// OM_FORCE_INLINE - for the tiny cast helpers in utility.hh that should vanish even in debug
// OM_COLD_FUNC    - for the assertion failure path
// OM_BUILTIN_UNREACHABLE - after a switch that covers every enumerator
#if defined(OM_COMPILER_MSVC)
#define OM_FORCE_INLINE __forceinline
#define OM_COLD_FUNC
#define OM_BUILTIN_UNREACHABLE __assume(0)
#else
// gcc needs the additional 'inline'
#define OM_FORCE_INLINE __attribute__((always_inline)) inline
#define OM_COLD_FUNC __attribute__((cold))
#define OM_BUILTIN_UNREACHABLE __builtin_unreachable()
#endif

// OM_UNUSED(expr) - silences unused warnings, expr is not evaluated
#define OM_UNUSED(expr) (void)(sizeof((expr)))
