#include <common/extent.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gtb;

TEST_CASE("Extent with a zero dimension has zero area", "[extent]")
{
    REQUIRE(hasZeroArea(Extent2u{}));
    REQUIRE(hasZeroArea(Extent2u{0, 600}));
    REQUIRE(hasZeroArea(Extent2u{800, 0}));
    REQUIRE_FALSE(hasZeroArea(Extent2u{800, 600}));
    REQUIRE_FALSE(hasZeroArea(Extent2i{-1, 1}));
}

TEST_CASE("Signed extents convert to unsigned", "[extent]")
{
    REQUIRE(toExtent2u(Extent2i{800, 600}) == Extent2u{800, 600});
    REQUIRE(toExtent2u(Extent2i{-5, 600}) == Extent2u{0, 600});
    REQUIRE(toExtent2u(Extent2i{800, -1}) == Extent2u{800, 0});
}

TEST_CASE("Extent equality", "[extent]")
{
    static_assert(Extent2u{1, 2} == Extent2u{1, 2});
    static_assert(Extent2u{1, 2} != Extent2u{2, 1});
}
