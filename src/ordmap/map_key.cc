#include "map_key.hh"

#include <ordmap/assert.hh>
#include <ordmap/map_error.hh>
#include <ordmap/to_string.hh>
#include <ordmap/utility.hh>
#include <ordmap/value.hh>

om::map_key::map_key(std::string name) : _kind(kind::string), _name(om::move(name)) {}

om::map_key::map_key(std::string_view name) : _kind(kind::string), _name(name) {}

om::map_key::map_key(char const* name) : _kind(kind::string)
{
    if (name == nullptr)
        throw om::invalid_key_error();
    _name = name;
}

om::map_key::map_key(om::identity id) : _kind(kind::identity), _address(id.address)
{
    if (id.address == nullptr)
        throw om::invalid_key_error();
}

om::map_key::map_key(om::value const& v)
{
    if (v.is_string())
    {
        _kind = kind::string;
        _name = v.as_string();
    }
    else if (v.is_object())
    {
        _kind = kind::identity;
        _address = v.as_identity().address;
        if (_address == nullptr)
            throw om::invalid_key_error();
    }
    else
    {
        throw om::invalid_key_error();
    }
}

std::string const& om::map_key::name() const
{
    OM_ASSERT(is_string(), "key is not a string key");
    return _name;
}

om::identity om::map_key::get_identity() const
{
    OM_ASSERT(is_identity(), "key is not an identity key");
    return om::identity{_address};
}

std::string om::map_key::to_string() const
{
    if (_kind == kind::string)
        return _name;

    return "object@" + om::to_string(_address);
}

int om::map_key::compare(map_key const& a, map_key const& b)
{
    if (a._kind != b._kind)
        return a._kind == kind::string ? -1 : 1;

    if (a._kind == kind::string)
    {
        auto const r = a._name.compare(b._name);
        return r < 0 ? -1 : r > 0 ? 1 : 0;
    }

    auto const less = std::less<void const*>();
    if (less(a._address, b._address))
        return -1;
    if (less(b._address, a._address))
        return 1;
    return 0;
}

size_t om::map_key::hash() const
{
    if (_kind == kind::string)
        return std::hash<std::string>()(_name);

    // keep identities apart from strings hashing to the same bucket
    return std::hash<void const*>()(_address) ^ size_t(0x9e3779b97f4a7c15ull);
}
