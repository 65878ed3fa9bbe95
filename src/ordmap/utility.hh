#pragma once

#include <ordmap/macros.hh>

#include <cstddef>
#include <functional>
#include <type_traits>

namespace om
{
// =========================================================================================================
// value categories
// =========================================================================================================
// om::move / om::forward instead of std:: so that <utility> stays out of the headers
// and the casts inline away in debug builds

template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    static_assert(!std::is_lvalue_reference_v<T>, "rvalue forwarded as lvalue");
    return static_cast<T&&>(value);
}

// =========================================================================================================
// callables
// =========================================================================================================

/// calls f(args...), member pointers included
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(om::forward<F>(f), om::forward<Args>(args)...);
}

/// F is callable with Args... and its result converts to R (any result for R = void)
template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

namespace impl
{
template <class Signature>
struct function_ptr_t;
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// om::function_ptr<bool(int)> is bool (*)(int)
template <class Signature>
using function_ptr = typename impl::function_ptr_t<Signature>::type;

// =========================================================================================================
// placement new
// =========================================================================================================

struct placement_new_tag
{
};

/// new (om::placement_new, &storage) T(args...) without pulling in <new>
constexpr placement_new_tag placement_new = {};

} // namespace om

[[nodiscard]] inline void* operator new(std::size_t, om::placement_new_tag, void* ptr) noexcept
{
    return ptr;
}
inline void operator delete(void*, om::placement_new_tag, void*) noexcept {}
