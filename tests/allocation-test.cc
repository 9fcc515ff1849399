#include <chunked-core/allocation.hh>
#include <chunked-core/impl/object_block.hh>
#include <chunked-core/utility.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <cstring>
#include <string>

TEST("allocation - system_allocate_bytes")
{
    SECTION("zero bytes yields nullptr")
    {
        auto p = ck::impl::system_allocate_bytes(0, 16);
        CHECK(p == nullptr);
        ck::impl::system_deallocate_bytes(p, 0, 16); // no-op
    }

    SECTION("alignment is honored")
    {
        for (auto alignment : {1, 2, 8, 16, 64, 256, 4096})
        {
            auto p = ck::impl::system_allocate_bytes(100, alignment);
            REQUIRE(p != nullptr);
            CHECK(reinterpret_cast<std::uintptr_t>(p) % alignment == 0);

            // memory is writable over the full range
            std::memset(p, 0xAB, 100);
            CHECK(p[99] == ck::byte(0xAB));

            ck::impl::system_deallocate_bytes(p, 100, alignment);
        }
    }

    SECTION("size not a multiple of alignment")
    {
        auto p = ck::impl::system_allocate_bytes(3, 64);
        REQUIRE(p != nullptr);
        CHECK(reinterpret_cast<std::uintptr_t>(p) % 64 == 0);
        ck::impl::system_deallocate_bytes(p, 3, 64);
    }
}

TEST("allocation - object_block")
{
    SECTION("default is unallocated")
    {
        ck::impl::object_block<int> b;
        CHECK(!b.is_allocated());
        CHECK(b.slot_count() == 0);
        CHECK(b.obj_start == b.obj_end);
    }

    SECTION("create_with_slots gives exactly the requested slots")
    {
        auto b = ck::impl::object_block<std::string>::create_with_slots(7);
        CHECK(b.is_allocated());
        CHECK(b.slot_count() == 7);
        CHECK(b.obj_start == b.alloc_start);
        CHECK(b.obj_end == b.alloc_start);
        CHECK(reinterpret_cast<std::uintptr_t>(b.alloc_start) % ck::impl::object_block<std::string>::alloc_alignment == 0);
    }

    SECTION("zero slots allocate nothing")
    {
        auto b = ck::impl::object_block<int>::create_with_slots(0);
        CHECK(!b.is_allocated());
    }

    SECTION("move transfers ownership and destroys live objects once")
    {
        static int dtor_count = 0;
        struct counted
        {
            ~counted() { ++dtor_count; }
        };

        dtor_count = 0;
        {
            auto a = ck::impl::object_block<counted>::create_with_slots(4);
            for (auto i = 0; i < 3; ++i)
            {
                new (ck::placement_new, a.obj_end) counted();
                a.obj_end++;
            }

            auto b = ck::move(a);
            CHECK(!a.is_allocated()); // NOLINT(bugprone-use-after-move)
            CHECK(b.obj_end - b.obj_start == 3);
            CHECK(dtor_count == 0);
        }
        CHECK(dtor_count == 3);
    }

    SECTION("block alignment is a power of two")
    {
        CHECK(ck::is_power_of_two(ck::impl::object_block<char>::alloc_alignment));
        CHECK(ck::impl::object_block<char>::alloc_alignment >= ck::isize(alignof(std::max_align_t)));
    }
}
