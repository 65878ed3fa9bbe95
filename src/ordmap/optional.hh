#pragma once

#include <ordmap/assert.hh>
#include <ordmap/fwd.hh>
#include <ordmap/utility.hh>

#include <type_traits>

/// tag for the empty state: om::optional<map_key> k = om::nullopt;
/// not default constructible so that "o = {}" stays unambiguous
struct om::nullopt_t
{
    struct private_tag
    {
    };
    explicit constexpr nullopt_t(private_tag) {}
};

namespace om
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::private_tag{}};
} // namespace om

/// A T or nothing, returned by ordered_map::find where "no key" must differ from every key.
/// Moving from an engaged optional leaves it empty.
/// Access is explicit via value() / value_or(), there is no operator* or operator->.
template <class T>
struct om::optional
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& v) // NOLINT(bugprone-forwarding-reference-overload)
    {
        impl_emplace(om::forward<U>(v));
    }

    optional(optional const& rhs)
    {
        if (rhs._engaged)
            impl_emplace(rhs._slot.value);
    }
    optional(optional&& rhs) noexcept
    {
        if (rhs._engaged)
        {
            impl_emplace(om::move(rhs._slot.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._engaged)
                impl_emplace(rhs._slot.value);
        }
        return *this;
    }
    optional& operator=(optional&& rhs) noexcept
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._engaged)
            {
                impl_emplace(om::move(rhs._slot.value));
                rhs.reset();
            }
        }
        return *this;
    }

    ~optional() { reset(); }

    // access
public:
    [[nodiscard]] bool has_value() const { return _engaged; }

    /// precondition: has_value()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        OM_ASSERT(self._engaged, "value() of an empty optional");
        return static_cast<Self&&>(self)._slot.value;
    }

    [[nodiscard]] T value_or(T fallback) const& { return _engaged ? _slot.value : fallback; }

    void reset()
    {
        if (!_engaged)
            return;
        _slot.value.~T();
        _engaged = false;
    }

    // comparison
public:
    /// equal if both are empty or both hold equal values
    [[nodiscard]] friend bool operator==(optional const& a, optional const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        if (a._engaged && b._engaged)
            return a._slot.value == b._slot.value;
        return a._engaged == b._engaged;
    }

    [[nodiscard]] friend bool operator==(optional const& a, T const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        return a._engaged && a._slot.value == b;
    }

    [[nodiscard]] friend bool operator==(optional const& a, nullopt_t) { return !a._engaged; }

    // helper
private:
    template <class... Args>
    void impl_emplace(Args&&... args)
    {
        new (om::placement_new, &_slot.value) T(om::forward<Args>(args)...);
        _engaged = true;
    }

    // members
private:
    // uninitialized storage, _engaged tracks the lifetime of value
    union slot
    {
        slot() {}
        ~slot() {}
        T value;
    };

    slot _slot;
    bool _engaged = false;
};
