#include "to_string.hh"

std::string om::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string om::to_string(char c)
{
    return std::string(1, c);
}

std::string om::to_string(void const* ptr)
{
    return std::format("{}", ptr);
}

std::string om::to_string(char const* s)
{
    return s == nullptr ? std::string() : std::string(s);
}

std::string om::to_string(std::string_view s)
{
    return std::string(s);
}
