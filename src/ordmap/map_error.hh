#pragma once

#include <ordmap/fwd.hh>
#include <ordmap/map_key.hh>

#include <exception>
#include <string>

/// Base of all errors reported by ordered_map
/// Raised synchronously at the call that caused them, the map is left unchanged.
struct om::map_error : std::exception
{
    explicit map_error(std::string message);

    [[nodiscard]] char const* what() const noexcept override;
    [[nodiscard]] std::string const& message() const noexcept { return _message; }

private:
    std::string _message;
};

/// A key was neither a string nor a (non-null) object reference
/// Raised when building a map_key, and therefore by set / create_from with such a key
struct om::invalid_key_error : om::map_error
{
    invalid_key_error();
};

/// remove() or a subscript remove() targeted a key without entry
struct om::key_not_found_error : om::map_error
{
    explicit key_not_found_error(om::map_key key);

    [[nodiscard]] om::map_key const& key() const noexcept { return _key; }

private:
    om::map_key _key;
};
