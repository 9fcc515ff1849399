#include <chunked-core/assert-handler.hh>
#include <chunked-core/utility.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>


namespace
{
struct Box
{
    int v;
    bool operator<(Box const& rhs) const { return v < rhs.v; }
};

struct MoveOnly
{
    int id;
    inline static int move_ctor_count = 0;
    inline static int move_assign_count = 0;

    explicit MoveOnly(int i = 0) : id(i) {}
    MoveOnly(MoveOnly const&) = delete;
    MoveOnly& operator=(MoveOnly const&) = delete;
    MoveOnly(MoveOnly&& other) noexcept : id(other.id)
    {
        other.id = -1;
        ++move_ctor_count;
    }
    MoveOnly& operator=(MoveOnly&& other) noexcept
    {
        id = other.id;
        other.id = -1;
        ++move_assign_count;
        return *this;
    }

    static void reset_counts()
    {
        move_ctor_count = 0;
        move_assign_count = 0;
    }
};
} // namespace

// type with its own swap, found via ADL
namespace swap_test
{
struct Swappable
{
    int value;
    inline static int adl_swap_count = 0;
};

void swap(Swappable& a, Swappable& b) noexcept
{
    ++Swappable::adl_swap_count;
    int const tmp = a.value;
    a.value = b.value;
    b.value = tmp;
}
} // namespace swap_test

TEST("utility - move and forward")
{
    int x = 5;
    static_assert(std::is_same_v<decltype(ck::move(x)), int&&>);
    static_assert(std::is_same_v<decltype(ck::forward<int&>(x)), int&>);
    static_assert(std::is_same_v<decltype(ck::forward<int&&>(10)), int&&>);

    MoveOnly::reset_counts();
    MoveOnly a(42);
    MoveOnly b(ck::move(a));
    CHECK(b.id == 42);
    CHECK(a.id == -1);
    CHECK(MoveOnly::move_ctor_count == 1);
}

TEST("utility - exchange")
{
    SECTION("integer")
    {
        int x = 5;
        int old = ck::exchange(x, 9);
        CHECK(old == 5);
        CHECK(x == 9);
    }

    SECTION("pointer steal")
    {
        int value = 1;
        int* p = &value;
        int* stolen = ck::exchange(p, nullptr);
        CHECK(stolen == &value);
        CHECK(p == nullptr);
    }

    SECTION("move-only")
    {
        MoveOnly a(10);
        MoveOnly b(20);
        MoveOnly old = ck::exchange(a, ck::move(b));
        CHECK(old.id == 10);
        CHECK(a.id == 20);
        CHECK(b.id == -1);
    }
}

TEST("utility - max")
{
    Box a{10}, b{20};
    CHECK(&ck::max(a, b) == &b);
    CHECK(&ck::max(b, a) == &b);

    Box c{15}, d{15};
    CHECK(&ck::max(c, d) == &d);

    static_assert(ck::max(3, 7) == 7);
}

TEST("utility - int_div_round_up")
{
    CHECK(ck::int_div_round_up(1, 5) == 1);
    CHECK(ck::int_div_round_up(5, 5) == 1);
    CHECK(ck::int_div_round_up(6, 5) == 2);
    CHECK(ck::int_div_round_up(7, 5) == 2);
    CHECK(ck::int_div_round_up(10, 5) == 2);
    CHECK(ck::int_div_round_up(ck::isize(1) << 40, ck::isize(3)) == 366503875926);
}

TEST("utility - alignment")
{
    CHECK(ck::is_power_of_two(1));
    CHECK(ck::is_power_of_two(64));
    CHECK(!ck::is_power_of_two(48));

    CHECK(ck::align_up(300, 16) == 304);
    CHECK(ck::align_up(304, 16) == 304);
    CHECK(ck::align_up(0, 64) == 0);
    CHECK(ck::align_up(ck::isize(65), 64) == 128);
}

TEST("utility - swap")
{
    SECTION("fundamental types")
    {
        int a = 1;
        int b = 2;
        ck::swap(a, b);
        CHECK(a == 2);
        CHECK(b == 1);
    }

    SECTION("move-only types use moves")
    {
        MoveOnly::reset_counts();
        MoveOnly a(1);
        MoveOnly b(2);
        ck::swap(a, b);
        CHECK(a.id == 2);
        CHECK(b.id == 1);
        CHECK(MoveOnly::move_ctor_count == 1);
        CHECK(MoveOnly::move_assign_count == 2);
    }

    SECTION("ADL overloads are preferred")
    {
        swap_test::Swappable::adl_swap_count = 0;
        swap_test::Swappable a{1};
        swap_test::Swappable b{2};
        ck::swap(a, b);
        CHECK(a.value == 2);
        CHECK(b.value == 1);
        CHECK(swap_test::Swappable::adl_swap_count == 1);
    }

    SECTION("standard library types")
    {
        std::string a = "left";
        std::string b = "right";
        ck::swap(a, b);
        CHECK(a == "right");
        CHECK(b == "left");
    }
}

TEST("utility - invoke_with_optional_idx")
{
    std::vector<ck::isize> indices;
    int sum = 0;

    ck::invoke_with_optional_idx(3, [&](int v) { sum += v; }, 10);
    ck::invoke_with_optional_idx(
        7,
        [&](ck::isize i, int v)
        {
            indices.push_back(i);
            sum += v;
        },
        20);

    CHECK(sum == 30);
    REQUIRE(indices.size() == 1);
    CHECK(indices[0] == 7);

    auto r = ck::invoke_with_optional_idx(2, [](ck::isize i, int v) { return i * v; }, 21);
    CHECK((r == 42));
}

TEST("utility - storage_for and placement_new")
{
    ck::storage_for<std::string> storage;
    auto* p = new (ck::placement_new, &storage.value) std::string("constructed");
    CHECK(p == &storage.value);
    CHECK(storage.value == "constructed");
    storage.value.~basic_string();
}

TEST("utility - int_div_round_up asserts positive operands")
{
    struct violation
    {
    };
    auto handler = ck::impl::scoped_assertion_handler([](ck::impl::assertion_info const&) { throw violation{}; });

    auto caught = false;
    try
    {
        (void)ck::int_div_round_up(0, 5);
    }
    catch (violation const&)
    {
        caught = true;
    }
    CHECK(caught);
}
