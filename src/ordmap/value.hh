#pragma once

#include <ordmap/fwd.hh>
#include <ordmap/map_key.hh>
#include <ordmap/ordered_map.hh>

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

/// Dynamically typed value for maps whose values are not known at compile time.
///
/// Kinds: null, boolean, integer (i64), floating (f64), string,
///        object (non-owning reference, compared by identity) and map (nested ordered_map<value>).
///
/// Values have value semantics: copying a value deep-copies a nested map.
/// Integers and floats compare numerically with each other, everything else only within its kind.
///
/// Usage:
///   auto config = om::ordered_map<om::value>{{"name", "demo"}, {"retries", 3}};
///   config["limits"] = om::ordered_map<om::value>{{"cpu", 2.5}};
///   widget w;
///   config.set(om::map_key(om::value::object(w)), true);
struct om::value
{
    enum class kind : u8
    {
        null,
        boolean,
        integer,
        floating,
        string,
        object,
        map,
    };

    // construction
public:
    value() = default;
    value(nullptr_t) {}
    value(bool b) : _data(std::in_place_type<bool>, b) {}

    /// a one-character string, 'x' is text and not its code point
    value(char c);

    template <std::integral T>
        requires(!std::is_same_v<T, bool> && !std::is_same_v<T, char>)
    value(T i) : _data(std::in_place_type<i64>, i64(i))
    {
    }

    template <std::floating_point T>
    value(T f) : _data(std::in_place_type<f64>, f64(f))
    {
    }

    value(char const* s);
    value(std::string s);
    value(std::string_view s);
    value(om::identity id);
    value(om::ordered_map<value> map);

    /// reference to obj, compared and used as key by identity
    template <class T>
    [[nodiscard]] static value object(T const& obj)
    {
        return value(om::identity_of(obj));
    }

    // queries
public:
    [[nodiscard]] kind get_kind() const { return kind(_data.index()); }

    [[nodiscard]] bool is_null() const { return get_kind() == kind::null; }
    [[nodiscard]] bool is_bool() const { return get_kind() == kind::boolean; }
    [[nodiscard]] bool is_integer() const { return get_kind() == kind::integer; }
    [[nodiscard]] bool is_floating() const { return get_kind() == kind::floating; }
    [[nodiscard]] bool is_number() const { return is_integer() || is_floating(); }
    [[nodiscard]] bool is_string() const { return get_kind() == kind::string; }
    [[nodiscard]] bool is_object() const { return get_kind() == kind::object; }
    [[nodiscard]] bool is_map() const { return get_kind() == kind::map; }

    /// false for null, false, 0, 0.0, "" and an empty map
    [[nodiscard]] bool is_truthy() const;

    // access
    // precondition: the value has the requested kind
public:
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] i64 as_integer() const;
    [[nodiscard]] f64 as_floating() const;
    [[nodiscard]] std::string const& as_string() const;
    [[nodiscard]] om::identity as_identity() const;
    [[nodiscard]] om::ordered_map<value> const& as_map() const;
    [[nodiscard]] om::ordered_map<value>& as_map();

    // comparison
public:
    [[nodiscard]] bool equals(value const& rhs) const;

    [[nodiscard]] friend bool operator==(value const& a, value const& b) { return a.equals(b); }

    // members
private:
    // owns a nested map and deep-copies it
    struct map_holder
    {
        std::unique_ptr<om::ordered_map<value>> map;

        explicit map_holder(om::ordered_map<value> m);
        map_holder(map_holder const& rhs);
        map_holder(map_holder&& rhs) noexcept;
        map_holder& operator=(map_holder const& rhs);
        map_holder& operator=(map_holder&& rhs) noexcept;
        ~map_holder();
    };

    // alternatives in the order of kind
    std::variant<std::monostate, bool, i64, f64, std::string, om::identity, map_holder> _data;
};

namespace om
{
/// null -> "", bool -> "true"/"false", numbers via std::format, strings verbatim,
/// objects -> "object@<hex address>", maps -> "[" values joined by "," "]"
[[nodiscard]] std::string to_string(value const& v);
} // namespace om

/// falsy sentinel is value(false), nested maps merge recursively
template <>
struct om::map_traits<om::value>
{
    [[nodiscard]] static om::value falsy() { return om::value(false); }

    static bool merge_recursive(om::value& into, om::value const& from);
};
