#include <ordmap/map_key.hh>
#include <ordmap/optional.hh>

#include <nexus/test.hh>

#include <string>

static_assert(std::is_constructible_v<om::optional<int>>);
static_assert(std::is_constructible_v<om::optional<int>, int>);
static_assert(std::is_constructible_v<om::optional<int>, om::nullopt_t>);
static_assert(std::is_convertible_v<om::map_key, om::optional<om::map_key>>);

namespace
{
struct non_trivial
{
    int value = 0;
    int* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, int* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            ++*destroyed;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&& rhs) noexcept : value(rhs.value), destroyed(rhs.destroyed) { rhs.destroyed = nullptr; }
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&& rhs) noexcept
    {
        value = rhs.value;
        destroyed = rhs.destroyed;
        rhs.destroyed = nullptr;
        return *this;
    }

    friend bool operator==(non_trivial const& a, non_trivial const& b) { return a.value == b.value; }
};
} // namespace

TEST("optional - empty and engaged")
{
    SECTION("default is empty")
    {
        om::optional<int> o;
        CHECK(!o.has_value());
        CHECK(o == om::nullopt);
        CHECK(o.value_or(7) == 7);
    }

    SECTION("from value")
    {
        om::optional<int> o = 5;
        CHECK(o.has_value());
        CHECK(o.value() == 5);
        CHECK(o == 5);
        CHECK(!(o == 6));
        CHECK(o.value_or(7) == 5);
    }

    SECTION("from nullopt")
    {
        om::optional<std::string> o = om::nullopt;
        CHECK(!o.has_value());
    }

    SECTION("value is mutable through a non-const optional")
    {
        om::optional<std::string> o = std::string("abc");
        o.value() += "def";
        CHECK(o.value() == "abcdef");
    }
}

TEST("optional - copy and move")
{
    SECTION("copy keeps the source")
    {
        om::optional<std::string> a = std::string("key");
        auto b = a;
        CHECK(a == b);
        CHECK(b.value() == "key");
        CHECK(a.value() == "key");
    }

    SECTION("move empties the source")
    {
        om::optional<std::string> a = std::string("key");
        auto b = om::move(a);
        CHECK(!a.has_value());
        CHECK(b.value() == "key");
    }

    SECTION("assignment between engaged and empty")
    {
        om::optional<std::string> a = std::string("x");
        om::optional<std::string> b;
        b = a;
        CHECK(b.value() == "x");
        a = om::nullopt;
        CHECK(!a.has_value());
        a = b;
        CHECK(a.value() == "x");
    }
}

TEST("optional - destruction")
{
    int destroyed = 0;

    {
        om::optional<non_trivial> o = non_trivial(1, &destroyed);
        CHECK(destroyed == 0);
    }
    CHECK(destroyed == 1);

    {
        om::optional<non_trivial> o = non_trivial(2, &destroyed);
        o.reset();
        CHECK(destroyed == 2);
        CHECK(!o.has_value());
    }
    CHECK(destroyed == 2);
}

TEST("optional - comparison")
{
    om::optional<int> a = 1;
    om::optional<int> b = 1;
    om::optional<int> c = 2;
    om::optional<int> e;
    om::optional<int> f;

    CHECK(a == b);
    CHECK(!(a == c));
    CHECK(!(a == e));
    CHECK(e == f);
}

TEST("optional - holding map keys")
{
    om::optional<om::map_key> k = om::map_key("name");
    REQUIRE(k.has_value());
    CHECK(k.value() == om::map_key("name"));
    CHECK(k == om::map_key("name"));
    CHECK(!(k == om::map_key("other")));
}
