#pragma once

#include <ordmap/fwd.hh>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

/// Identity of an object, i.e. its address
/// Two distinct objects with equal contents have distinct identities.
/// Non-owning: the object must outlive every key and value built from its identity.
struct om::identity
{
    void const* address = nullptr;

    [[nodiscard]] friend bool operator==(identity, identity) = default;
};

namespace om
{
/// Usage:
///   widget w;
///   m.set(om::identity_of(w), 42);
template <class T>
[[nodiscard]] om::identity identity_of(T const& obj)
{
    return om::identity{static_cast<void const*>(std::addressof(obj))};
}
} // namespace om

/// Key of an ordered_map: either a string or an object identity
///
/// Implicitly constructible from strings and identities, so that m.set("name", v) reads naturally.
/// Construction from a dynamic om::value is explicit because it may fail:
/// only string and object values are valid keys, everything else raises om::invalid_key_error.
/// A null char const* or a null identity is rejected the same way.
struct om::map_key
{
    enum class kind : u8
    {
        string,
        identity,
    };

    // construction
public:
    map_key(std::string name);
    map_key(std::string_view name);
    map_key(char const* name);
    map_key(om::identity id);

    /// throws om::invalid_key_error unless v is a string or an object
    explicit map_key(om::value const& v);

    // queries
public:
    [[nodiscard]] kind get_kind() const { return _kind; }
    [[nodiscard]] bool is_string() const { return _kind == kind::string; }
    [[nodiscard]] bool is_identity() const { return _kind == kind::identity; }

    /// precondition: is_string()
    [[nodiscard]] std::string const& name() const;

    /// precondition: is_identity()
    [[nodiscard]] om::identity get_identity() const;

    /// the name for string keys, "object@<hex address>" for identity keys
    [[nodiscard]] std::string to_string() const;

    /// three-way comparison: string keys order before identity keys,
    /// strings lexicographically, identities by address
    [[nodiscard]] static int compare(map_key const& a, map_key const& b);

    [[nodiscard]] size_t hash() const;

    [[nodiscard]] friend bool operator==(map_key const& a, map_key const& b)
    {
        if (a._kind != b._kind)
            return false;
        return a._kind == kind::string ? a._name == b._name : a._address == b._address;
    }

    // members
private:
    kind _kind = kind::string;
    std::string _name;
    void const* _address = nullptr;
};

template <>
struct std::hash<om::map_key>
{
    size_t operator()(om::map_key const& key) const noexcept { return key.hash(); }
};
