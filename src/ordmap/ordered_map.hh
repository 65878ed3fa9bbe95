#pragma once

#include <ordmap/assert.hh>
#include <ordmap/function_ref.hh>
#include <ordmap/fwd.hh>
#include <ordmap/map_error.hh>
#include <ordmap/map_key.hh>
#include <ordmap/optional.hh>
#include <ordmap/to_string.hh>
#include <ordmap/utility.hh>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>


namespace om::impl
{
template <class T>
constexpr bool is_ordered_map = false;
template <class V>
constexpr bool is_ordered_map<om::ordered_map<V>> = true;
} // namespace om::impl

/// Customization point for the value type of an ordered_map.
/// Specialize to change the falsy sentinel or to make a type mergeable by merge_mode::recursive.
/// om::value ships its own specialization (see value.hh).
template <class V>
struct om::map_traits
{
    /// returned by get / first / last when nothing is found
    /// V{} in general, which is false for bool and 0 for numbers
    [[nodiscard]] static V falsy()
        requires std::is_default_constructible_v<V>
    {
        return V{};
    }

    /// merges "from" into "into" if both are nested maps and returns true
    /// returns false (and does nothing) otherwise, the caller then replaces the value
    static bool merge_recursive(V& into, V const& from)
    {
        if constexpr (impl::is_ordered_map<V>)
        {
            into.merge(from, om::merge_mode::recursive);
            return true;
        }
        else
        {
            OM_UNUSED(into);
            OM_UNUSED(from);
            return false;
        }
    }
};

/// Insertion-ordered associative container mapping om::map_key to V.
///
/// Entries keep the order in which their keys were first inserted.
/// Overwriting a key keeps its position, removing a key closes the gap,
/// only sort() reorders. Copies (copy(), filter(), copy construction) are independent
/// of the source and keep its current order.
///
/// Lookup by key is O(1) through an index from key to position,
/// removal and reordering are O(n) because positions are re-indexed.
///
/// Lookups that may miss come in two flavors:
///   - get(key) / first() / last() return map_traits<V>::falsy() when nothing is found
///     (a stored falsy value is indistinguishable from a miss, use exists() or try_get())
///   - try_get(key) returns nullptr and find(value) an empty optional when nothing is found
///
/// Errors:
///   - remove() of an absent key throws om::key_not_found_error
///   - invalid keys are rejected while building the map_key (om::invalid_key_error)
///
/// Usage:
///   auto m = om::ordered_map<int>{{"b", 2}, {"a", 1}};
///   m.set("c", 3).remove("b");
///   m["d"] = 4;
///   for (auto const& [key, value] : m)
///       use(key, value);
template <class V>
struct om::ordered_map
{
    using value_type = V;

    struct entry
    {
        om::map_key key;
        V value;

        [[nodiscard]] friend bool operator==(entry const&, entry const&) = default;
    };

    /// lazy forward range over the values of a map, in entry order
    /// refers to the live storage: invalidated by any mutation of the map
    struct value_sequence
    {
        struct iterator
        {
            using iterator_category = std::forward_iterator_tag;
            using value_type = V;
            using difference_type = std::ptrdiff_t;
            using pointer = V const*;
            using reference = V const&;

            entry const* pos = nullptr;

            [[nodiscard]] V const& operator*() const { return pos->value; }
            [[nodiscard]] V const* operator->() const { return &pos->value; }

            iterator& operator++()
            {
                ++pos;
                return *this;
            }
            iterator operator++(int)
            {
                auto r = *this;
                ++pos;
                return r;
            }

            [[nodiscard]] friend bool operator==(iterator, iterator) = default;
        };

        [[nodiscard]] iterator begin() const { return {_begin}; }
        [[nodiscard]] iterator end() const { return {_end}; }

        [[nodiscard]] isize size() const { return _end - _begin; }
        [[nodiscard]] bool empty() const { return _begin == _end; }

        value_sequence(entry const* b, entry const* e) : _begin(b), _end(e) {}

    private:
        entry const* _begin;
        entry const* _end;
    };

    /// result of operator[] on a mutable map
    /// assignment is set(), conversion to V is get(), plus exists() and remove()
    struct subscript_proxy
    {
        subscript_proxy(ordered_map& map, om::map_key key) : _map(map), _key(om::move(key)) {}

        subscript_proxy& operator=(V value)
        {
            _map.set(_key, om::move(value));
            return *this;
        }
        subscript_proxy& operator=(subscript_proxy const& rhs) { return *this = rhs.get(); }

        [[nodiscard]] V get() const { return _map.get(_key); }
        operator V() const { return get(); }

        [[nodiscard]] bool exists() const { return _map.exists(_key); }

        /// throws om::key_not_found_error if the key has no entry
        void remove() { _map.remove(_key); }

    private:
        ordered_map& _map;
        om::map_key _key;
    };

    // construction
public:
    ordered_map() = default;

    /// inserts the entries in order via set(), later duplicates overwrite earlier ones in place
    ordered_map(std::initializer_list<entry> entries)
    {
        _entries.reserve(entries.size());
        for (auto const& e : entries)
            set(e.key, e.value);
    }

    /// builds a map from any range of pair-like (key, value) items, in order
    /// keys are converted with om::map_key(key), which throws om::invalid_key_error
    /// for dynamic values that are neither strings nor objects
    template <class Range>
    [[nodiscard]] static ordered_map create_from(Range const& pairs)
    {
        ordered_map m;
        for (auto const& [k, v] : pairs)
            m.set(om::map_key(k), V(v));
        return m;
    }

    ordered_map(ordered_map const&) = default;
    ordered_map(ordered_map&&) noexcept = default;
    ordered_map& operator=(ordered_map const&) = default;
    ordered_map& operator=(ordered_map&&) noexcept = default;
    ~ordered_map() = default;

    // modifiers
public:
    /// appends a new entry or overwrites the value of an existing key in place
    ordered_map& set(om::map_key key, V value)
    {
        auto const it = _index.find(key);
        if (it != _index.end())
        {
            _entries[it->second].value = om::move(value);
            return *this;
        }

        auto const pos = isize(_entries.size());
        _entries.push_back(entry{key, om::move(value)});
        _index.emplace(om::move(key), pos);
        return *this;
    }

    /// removes the entry of key, later entries keep their relative order
    /// throws om::key_not_found_error (and changes nothing) if key has no entry
    ordered_map& remove(om::map_key const& key)
    {
        auto const it = _index.find(key);
        if (it == _index.end())
            throw om::key_not_found_error(key);

        auto const pos = it->second;
        _index.erase(it);
        _entries.erase(_entries.begin() + pos);

        for (auto i = pos; i < isize(_entries.size()); ++i)
            _index.find(_entries[i].key)->second = i;

        return *this;
    }

    ordered_map& clear()
    {
        _entries.clear();
        _index.clear();
        return *this;
    }

    /// stable sort of the entries by key
    /// comparator(a, b) returns negative if a goes first, positive if b goes first, zero if equivalent
    ordered_map& sort(om::function_ref<int(om::map_key const&, om::map_key const&)> comparator)
    {
        std::stable_sort(_entries.begin(), _entries.end(),
                         [&](entry const& a, entry const& b) { return comparator(a.key, b.key) < 0; });
        impl_rebuild_index();
        return *this;
    }

    /// sort by om::map_key::compare
    ordered_map& sort() { return sort(&om::map_key::compare); }

    /// overlays the entries of other onto this map
    /// colliding keys keep their position and take the value of other, new keys are appended in other's order
    /// with merge_mode::recursive, colliding nested maps are merged with the same rule instead of replaced
    /// other may be a map owned by one of our own values
    ordered_map& merge(ordered_map const& other, om::merge_mode mode = om::merge_mode::shallow)
    {
        // all keys collide with themselves
        if (&other == this)
            return *this;

        // other may be owned by one of our values (a nested map) and die during set()
        auto const incoming = other._entries;

        for (auto const& e : incoming)
        {
            if (mode == om::merge_mode::recursive)
            {
                auto* const mine = try_get(e.key);
                if (mine != nullptr && om::map_traits<V>::merge_recursive(*mine, e.value))
                    continue;
            }

            set(e.key, e.value);
        }

        return *this;
    }

    // lookup
public:
    /// value of key, or map_traits<V>::falsy() if key has no entry
    [[nodiscard]] V get(om::map_key const& key) const
    {
        auto const* v = try_get(key);
        return v != nullptr ? *v : om::map_traits<V>::falsy();
    }

    /// value of key, or default_value if key has no entry
    [[nodiscard]] V get(om::map_key const& key, V default_value) const
    {
        auto const* v = try_get(key);
        return v != nullptr ? *v : default_value;
    }

    /// pointer to the stored value, nullptr if key has no entry
    /// invalidated by any structural modification of the map
    [[nodiscard]] V const* try_get(om::map_key const& key) const
    {
        auto const it = _index.find(key);
        return it == _index.end() ? nullptr : &_entries[it->second].value;
    }
    [[nodiscard]] V* try_get(om::map_key const& key)
    {
        auto const it = _index.find(key);
        return it == _index.end() ? nullptr : &_entries[it->second].value;
    }

    /// true iff key has an entry, no matter what value is stored
    [[nodiscard]] bool exists(om::map_key const& key) const { return _index.contains(key); }

    /// key of the first entry (in order) whose value compares equal, empty if none does
    [[nodiscard]] om::optional<om::map_key> find(V const& value) const
    {
        for (auto const& e : _entries)
            if (e.value == value)
                return e.key;
        return om::nullopt;
    }

    /// value of the first entry, or map_traits<V>::falsy() if empty
    [[nodiscard]] V first() const { return _entries.empty() ? om::map_traits<V>::falsy() : _entries.front().value; }

    /// value of the last entry, or map_traits<V>::falsy() if empty
    [[nodiscard]] V last() const { return _entries.empty() ? om::map_traits<V>::falsy() : _entries.back().value; }

    // snapshots
public:
    /// copy of all values in entry order
    [[nodiscard]] std::vector<V> all() const
    {
        std::vector<V> values;
        values.reserve(_entries.size());
        for (auto const& e : _entries)
            values.push_back(e.value);
        return values;
    }

    /// copy of all keys in entry order
    [[nodiscard]] std::vector<om::map_key> keys() const
    {
        std::vector<om::map_key> keys;
        keys.reserve(_entries.size());
        for (auto const& e : _entries)
            keys.push_back(e.key);
        return keys;
    }

    /// new sequence over the values, each call starts from the first entry again
    [[nodiscard]] value_sequence each() const
    {
        return value_sequence(_entries.data(), _entries.data() + _entries.size());
    }

    [[nodiscard]] ordered_map copy() const { return *this; }

    /// new map with the entries for which predicate(value, key) is true, in order
    [[nodiscard]] ordered_map filter(om::function_ref<bool(V const&, om::map_key const&)> predicate) const
    {
        ordered_map result;
        for (auto const& e : _entries)
            if (predicate(e.value, e.key))
                result.set(e.key, e.value);
        return result;
    }

    /// joins to_string(value) of all values, separated by separator
    [[nodiscard]] std::string concat(std::string_view separator) const
    {
        using om::to_string;

        std::string result;
        auto is_first = true;
        for (auto const& e : _entries)
        {
            if (!is_first)
                result += separator;
            is_first = false;
            result += to_string(e.value);
        }
        return result;
    }

    /// left fold over the entries in order, starting with an empty string
    /// reducer(accumulator, value, key) returns the next accumulator
    [[nodiscard]] std::string concat(
        om::function_ref<std::string(std::string, V const&, om::map_key const&)> reducer) const
    {
        std::string result;
        for (auto const& e : _entries)
            result = reducer(om::move(result), e.value, e.key);
        return result;
    }

    // queries
public:
    [[nodiscard]] isize count() const { return isize(_entries.size()); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    // subscript
public:
    /// m[key] = v is set(key, v), V(m[key]) is get(key), m[key].remove() is remove(key)
    [[nodiscard]] subscript_proxy operator[](om::map_key key) { return subscript_proxy(*this, om::move(key)); }

    /// same as get(key)
    [[nodiscard]] V operator[](om::map_key const& key) const { return get(key); }

    // iterators
public:
    /// iteration over the entries in order, keys and values are read-only
    [[nodiscard]] entry const* begin() const { return _entries.data(); }
    [[nodiscard]] entry const* end() const { return _entries.data() + _entries.size(); }

    // comparison
public:
    /// same entries in the same order
    [[nodiscard]] friend bool operator==(ordered_map const& a, ordered_map const& b) { return a._entries == b._entries; }

    // helper
private:
    void impl_rebuild_index()
    {
        _index.clear();
        _index.reserve(_entries.size());
        for (auto i = isize(0); i < isize(_entries.size()); ++i)
            _index.emplace(_entries[i].key, i);
    }

    // members
private:
    std::vector<entry> _entries;
    std::unordered_map<om::map_key, isize> _index;
};
