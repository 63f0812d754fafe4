#include <catch2/catch.hpp>
#include "edge_noise.hpp"
#include "util/RandomSource.hpp"

TEST_CASE("key point count follows edgeDetails", "[noise]")
{
    REQUIRE(noiseKeyPointCount(0) == 6);
    REQUIRE(noiseKeyPointCount(100) == 40);
    REQUIRE(noiseKeyPointCount(50) == 23);
    REQUIRE(noiseKeyPointCount(-20) == 6);
    REQUIRE(noiseKeyPointCount(400) == 40);
}

TEST_CASE("noise profiles are bounded and taper at the ends", "[noise]")
{
    util::CvRandomSource rng(7);
    const EdgeNoiseProfiles p = generateEdgeNoise(70, rng);
    const size_t n = static_cast<size_t>(noiseKeyPointCount(70));

    for (const NoiseProfile* prof : { &p.top, &p.right, &p.bottom, &p.left })
    {
        REQUIRE(prof->size() == n);
        for (float v : *prof)
        {
            REQUIRE(v >= -1.0f);
            REQUIRE(v <= 1.0f);
        }
        REQUIRE(prof->front() == Approx(0.0f).margin(1e-6));
        REQUIRE(prof->back() == Approx(0.0f).margin(1e-6));
    }
    REQUIRE(p.top != p.right);
    REQUIRE(p.bottom != p.left);
}

TEST_CASE("EdgeNoiseCache regenerates only on detail or intensity changes", "[noise]")
{
    util::CvRandomSource rng(11);
    EdgeNoiseCache cache;
    REQUIRE_FALSE(cache.hasProfiles());

    StyleParameters params;
    REQUIRE(cache.update(params, rng));
    REQUIRE(cache.generation() == 1);
    const EdgeNoiseProfiles first = cache.profiles();

    SECTION("unrelated controls keep the profiles")
    {
        params.size = 10;
        params.shadowBlur = 90;
        params.textureStrength = 0;
        params.cutoutStyle = 100;
        params.movement = 55;
        REQUIRE_FALSE(cache.update(params, rng));
        REQUIRE(cache.generation() == 1);
        REQUIRE(cache.profiles().top == first.top);
        REQUIRE(cache.profiles().left == first.left);
    }

    SECTION("edgeDetails change regenerates")
    {
        params.edgeDetails = 90;
        REQUIRE(cache.update(params, rng));
        REQUIRE(cache.generation() == 2);
        REQUIRE(cache.profiles().top.size() == static_cast<size_t>(noiseKeyPointCount(90)));
    }

    SECTION("edgeIntensity change regenerates")
    {
        params.edgeIntensity = 10;
        REQUIRE(cache.update(params, rng));
        REQUIRE(cache.generation() == 2);
        REQUIRE(cache.profiles().top != first.top);
    }

    SECTION("reset drops the profiles")
    {
        cache.reset();
        REQUIRE_FALSE(cache.hasProfiles());
        REQUIRE(cache.update(params, rng));
    }
}
