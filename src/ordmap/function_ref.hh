#pragma once

#include <ordmap/assert.hh>
#include <ordmap/fwd.hh>
#include <ordmap/utility.hh>

#include <memory>
#include <type_traits>

/// Non-owning, type-erased reference to a callable with signature R(Args...)
///
/// This is how ordered_map takes comparators, predicates and reducers:
///   m.sort([](om::map_key const& a, om::map_key const& b) { return om::map_key::compare(a, b); });
///   auto const big = m.filter([&](int const& v, om::map_key const&) { return v > limit; });
///
/// Accepts lambdas, functors, function pointers and member pointers.
/// Free functions are passed by pointer: m.sort(&by_length).
/// The callable is referenced, not copied: it must outlive the function_ref.
/// Passing a temporary (lambda or pointer) as argument is fine, storing a function_ref to it is not.
///
/// The constructor only participates for callables matching the signature,
/// so concat(std::string_view) and concat(function_ref<...>) can be overloaded.
template <class R, class... Args>
struct om::function_ref<R(Args...)>
{
    // construction
public:
    /// empty, calling it is a precondition violation
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref> && !std::is_function_v<std::remove_reference_t<F>>
                 && om::is_invocable_r<R, F&, Args...>)
    function_ref(F&& f) // NOLINT(bugprone-forwarding-reference-overload)
      : _payload(const_cast<void*>(static_cast<void const*>(std::addressof(f))))
    {
        using Fn = std::remove_reference_t<F>;
        _thunk = [](void* p, Args... args) -> R { return om::invoke(*static_cast<Fn*>(p), om::forward<Args>(args)...); };
    }

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    R operator()(Args... args) const
    {
        OM_ASSERT(_thunk != nullptr, "called an empty function_ref");
        return _thunk(_payload, om::forward<Args>(args)...);
    }

    // members
private:
    void* _payload = nullptr;
    om::function_ptr<R(void*, Args...)> _thunk = nullptr;
};
