#include <catch2/catch.hpp>
#include "util/RangeMap.hpp"

using util::mapRange;
using util::cosineInterpolate;

TEST_CASE("mapRange remaps linearly", "[range]")
{
    REQUIRE(mapRange(50, 0, 100, 0, 10) == Approx(5.0));
    REQUIRE(mapRange(0, 0, 100, -25, 25) == Approx(-25.0));
    REQUIRE(mapRange(100, 0, 100, -25, 25) == Approx(25.0));
    REQUIRE(mapRange(50, 0, 100, -25, 25) == Approx(0.0));

    SECTION("descending output range")
    {
        REQUIRE(mapRange(0, 0, 100, 15, 5) == Approx(15.0));
        REQUIRE(mapRange(100, 0, 100, 15, 5) == Approx(5.0));
    }

    SECTION("content scale for size 50")
    {
        REQUIRE(mapRange(50, 10, 100, 0.2, 1.0) == Approx(0.5555556));
    }
}

TEST_CASE("mapRange returns outMin for a collapsed input range", "[range]")
{
    for (double v : { -10.0, 0.0, 3.0, 1e6 })
    {
        REQUIRE(mapRange(v, 7, 7, 1.5, 99) == 1.5);
        REQUIRE(mapRange(v, 0, 0, -4, 4) == -4.0);
    }
}

TEST_CASE("cosineInterpolate eases between samples", "[range]")
{
    REQUIRE(cosineInterpolate(2.0, 6.0, 0.0) == Approx(2.0));
    REQUIRE(cosineInterpolate(2.0, 6.0, 1.0) == Approx(6.0));
    REQUIRE(cosineInterpolate(2.0, 6.0, 0.5) == Approx(4.0));
    // Slower than linear near the ends
    REQUIRE(cosineInterpolate(0.0, 1.0, 0.1) < 0.1);
    REQUIRE(cosineInterpolate(0.0, 1.0, 0.9) > 0.9);
}
