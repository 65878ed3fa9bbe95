#include "map_error.hh"

#include <ordmap/utility.hh>

om::map_error::map_error(std::string message) : _message(om::move(message)) {}

char const* om::map_error::what() const noexcept
{
    return _message.c_str();
}

om::invalid_key_error::invalid_key_error() : map_error("Map key name must be a string or object") {}

om::key_not_found_error::key_not_found_error(om::map_key key)
  : map_error("The map has no key named \"" + key.to_string() + "\""), _key(om::move(key))
{
}
