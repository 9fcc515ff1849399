#include <chunked-core/assert-handler.hh>
#include <chunked-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial for trivial payloads
static_assert(std::is_constructible_v<ck::optional<int>, int>);
static_assert(std::is_constructible_v<ck::optional<int>, ck::nullopt_t>);
static_assert(std::is_trivially_copyable_v<ck::optional<int>>);
static_assert(std::is_trivially_destructible_v<ck::optional<int>>);
static_assert(!std::is_trivially_destructible_v<ck::optional<std::string>>);
static_assert(!std::is_copy_constructible_v<ck::optional<std::unique_ptr<int>>>);

// reference optionals
static_assert(sizeof(ck::optional<int&>) == sizeof(int*));
static_assert(std::is_constructible_v<ck::optional<int const&>, ck::optional<int&>>);
static_assert(!std::is_constructible_v<ck::optional<int&>, ck::optional<int const&>>);
static_assert(!std::is_constructible_v<ck::optional<int&>, int const&>);

namespace
{
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }

    friend bool operator==(counting_type const&, counting_type const&) = default;
};

struct base
{
    int id = 1;
};
struct derived : base
{
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default and nullopt construction")
    {
        auto const a = ck::optional<int>{};
        auto const b = ck::optional<int>{ck::nullopt};
        CHECK(!a.has_value());
        CHECK(!b.has_value());
        CHECK((a == b));
    }

    SECTION("value construction")
    {
        auto const opt = ck::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
        CHECK((opt == 42));
        CHECK((opt != 41));
    }

    SECTION("assignment")
    {
        auto opt = ck::optional<int>{};
        opt = 42;
        CHECK(opt.value() == 42);
        opt = ck::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - non-trivial types")
{
    SECTION("strings")
    {
        auto opt = ck::optional<std::string>{"hello"};
        CHECK(opt.has_value());
        CHECK(opt.value() == "hello");
        opt.value() += " world";
        CHECK((opt == std::string("hello world")));
    }

    SECTION("move leaves the source empty")
    {
        auto a = ck::optional<std::string>{"x"};
        auto b = ck::move(a);
        CHECK(b.value() == "x");
        CHECK(!a.has_value()); // NOLINT(bugprone-use-after-move)

        auto c = ck::optional<std::string>{"y"};
        c = ck::move(b);
        CHECK(c.value() == "x");
        CHECK(!b.has_value()); // NOLINT(bugprone-use-after-move)
    }

    SECTION("lifetime")
    {
        counting_type::reset_counters();
        {
            auto a = ck::optional<counting_type>{counting_type(1)};
            auto b = a;
            CHECK(counting_type::copy_ctor_count == 1);
            CHECK((b == a));
            b = ck::nullopt;
            CHECK(!b.has_value());
        }
        auto const constructed
            = counting_type::value_ctor_count + counting_type::copy_ctor_count + counting_type::move_ctor_count;
        CHECK(counting_type::dtor_count == constructed);
    }

    SECTION("move-only payload")
    {
        auto opt = ck::optional<std::unique_ptr<int>>{std::make_unique<int>(5)};
        auto p = ck::move(opt).value();
        REQUIRE(p != nullptr);
        CHECK(*p == 5);
    }
}

TEST("optional - references")
{
    SECTION("empty")
    {
        ck::optional<int&> r;
        CHECK(!r.has_value());
        CHECK(r.as_ptr() == nullptr);

        ck::optional<int&> n = ck::nullopt;
        CHECK(!n.has_value());
    }

    SECTION("refers to the original object")
    {
        int x = 1;
        ck::optional<int&> r = x;
        REQUIRE(r.has_value());
        CHECK(r.as_ptr() == &x);

        r.value() = 5;
        CHECK(x == 5);
        CHECK((r == 5));
    }

    SECTION("rebinds on assignment")
    {
        int x = 1;
        int y = 2;
        ck::optional<int&> r = x;
        r = y;
        r.value() = 20;
        CHECK(x == 1);
        CHECK(y == 20);
    }

    SECTION("const and base conversions")
    {
        int x = 3;
        ck::optional<int&> r = x;
        ck::optional<int const&> cr = r;
        CHECK(cr.as_ptr() == &x);

        derived d;
        ck::optional<base&> b = d;
        CHECK(b.value().id == 1);
    }

    SECTION("compares values, not addresses")
    {
        int x = 4;
        int y = 4;
        CHECK((ck::optional<int&>{x} == ck::optional<int&>{y}));
        CHECK((ck::optional<int&>{} != ck::optional<int&>{y}));
        CHECK((ck::optional<int&>{} == ck::optional<int&>{}));
    }
}

TEST("optional - accessing empty value is a contract violation")
{
    struct violation
    {
    };
    auto handler = ck::impl::scoped_assertion_handler([](ck::impl::assertion_info const&) { throw violation{}; });

    auto caught = 0;
    try
    {
        (void)ck::optional<int>{}.value();
    }
    catch (violation const&)
    {
        ++caught;
    }

    try
    {
        (void)ck::optional<int&>{}.value();
    }
    catch (violation const&)
    {
        ++caught;
    }

    CHECK(caught == 2);
}
