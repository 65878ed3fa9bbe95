#include "value.hh"

#include <ordmap/assert.hh>
#include <ordmap/to_string.hh>
#include <ordmap/utility.hh>

om::value::value(char c) : _data(std::in_place_type<std::string>, std::string(1, c)) {}

om::value::value(char const* s) : _data(std::in_place_type<std::string>, s == nullptr ? "" : s) {}

om::value::value(std::string s) : _data(std::in_place_type<std::string>, om::move(s)) {}

om::value::value(std::string_view s) : _data(std::in_place_type<std::string>, s) {}

om::value::value(om::identity id) : _data(std::in_place_type<om::identity>, id) {}

om::value::value(om::ordered_map<value> map) : _data(std::in_place_type<map_holder>, om::move(map)) {}

om::value::map_holder::map_holder(om::ordered_map<value> m)
  : map(std::make_unique<om::ordered_map<value>>(om::move(m)))
{
}

om::value::map_holder::map_holder(map_holder const& rhs) : map(std::make_unique<om::ordered_map<value>>(*rhs.map)) {}

om::value::map_holder::map_holder(map_holder&& rhs) noexcept = default;

om::value::map_holder& om::value::map_holder::operator=(map_holder const& rhs)
{
    if (this != &rhs)
        map = std::make_unique<om::ordered_map<value>>(*rhs.map);
    return *this;
}

om::value::map_holder& om::value::map_holder::operator=(map_holder&& rhs) noexcept = default;

om::value::map_holder::~map_holder() = default;

bool om::value::is_truthy() const
{
    switch (get_kind())
    {
    case kind::null:
        return false;
    case kind::boolean:
        return std::get<bool>(_data);
    case kind::integer:
        return std::get<i64>(_data) != 0;
    case kind::floating:
        return std::get<f64>(_data) != 0.0;
    case kind::string:
        return !std::get<std::string>(_data).empty();
    case kind::object:
        return true;
    case kind::map:
        return !std::get<map_holder>(_data).map->empty();
    }
    OM_BUILTIN_UNREACHABLE;
}

bool om::value::as_bool() const
{
    OM_ASSERT(is_bool(), "value is not a bool");
    return std::get<bool>(_data);
}

om::i64 om::value::as_integer() const
{
    OM_ASSERT(is_integer(), "value is not an integer");
    return std::get<i64>(_data);
}

om::f64 om::value::as_floating() const
{
    OM_ASSERT(is_floating(), "value is not a float");
    return std::get<f64>(_data);
}

std::string const& om::value::as_string() const
{
    OM_ASSERT(is_string(), "value is not a string");
    return std::get<std::string>(_data);
}

om::identity om::value::as_identity() const
{
    OM_ASSERT(is_object(), "value is not an object");
    return std::get<om::identity>(_data);
}

om::ordered_map<om::value> const& om::value::as_map() const
{
    OM_ASSERT(is_map(), "value is not a map");
    return *std::get<map_holder>(_data).map;
}

om::ordered_map<om::value>& om::value::as_map()
{
    OM_ASSERT(is_map(), "value is not a map");
    return *std::get<map_holder>(_data).map;
}

bool om::value::equals(value const& rhs) const
{
    if (is_number() && rhs.is_number() && get_kind() != rhs.get_kind())
    {
        auto const a = is_integer() ? f64(as_integer()) : as_floating();
        auto const b = rhs.is_integer() ? f64(rhs.as_integer()) : rhs.as_floating();
        return a == b;
    }

    if (get_kind() != rhs.get_kind())
        return false;

    switch (get_kind())
    {
    case kind::null:
        return true;
    case kind::boolean:
        return std::get<bool>(_data) == std::get<bool>(rhs._data);
    case kind::integer:
        return std::get<i64>(_data) == std::get<i64>(rhs._data);
    case kind::floating:
        return std::get<f64>(_data) == std::get<f64>(rhs._data);
    case kind::string:
        return std::get<std::string>(_data) == std::get<std::string>(rhs._data);
    case kind::object:
        return std::get<om::identity>(_data) == std::get<om::identity>(rhs._data);
    case kind::map:
        return *std::get<map_holder>(_data).map == *std::get<map_holder>(rhs._data).map;
    }
    OM_BUILTIN_UNREACHABLE;
}

std::string om::to_string(value const& v)
{
    switch (v.get_kind())
    {
    case value::kind::null:
        return {};
    case value::kind::boolean:
        return om::to_string(v.as_bool());
    case value::kind::integer:
        return om::to_string(v.as_integer());
    case value::kind::floating:
        return om::to_string(v.as_floating());
    case value::kind::string:
        return v.as_string();
    case value::kind::object:
        return "object@" + om::to_string(v.as_identity().address);
    case value::kind::map:
        return "[" + v.as_map().concat(",") + "]";
    }
    OM_BUILTIN_UNREACHABLE;
}

bool om::map_traits<om::value>::merge_recursive(om::value& into, om::value const& from)
{
    if (!into.is_map() || !from.is_map())
        return false;

    into.as_map().merge(from.as_map(), om::merge_mode::recursive);
    return true;
}
