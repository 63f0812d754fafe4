#include <catch2/catch.hpp>
#include "geometry.hpp"

TEST_CASE("size 50 scales content to 0.555", "[geometry]")
{
    StyleParameters p;
    p.size = 50;
    p.edgeThickness = 35;
    const FrameGeometry g = computeFrameGeometry(cv::Size(400, 300), p, ContainerBounds(1000, 1000));

    REQUIRE(g.contentScale == Approx(0.5555556));
    REQUIRE(g.contentWidth == 222);
    REQUIRE(g.contentHeight == 167);
    REQUIRE(g.borderThickness == Approx(167 * 0.20 * 0.35));
    REQUIRE(g.canvasWidth == g.contentWidth + 2 * g.borderPx);
    REQUIRE(g.canvasHeight == g.contentHeight + 2 * g.borderPx);
    REQUIRE(g.contentRect() == cv::Rect(g.borderPx, g.borderPx, 222, 167));
}

TEST_CASE("content shrinks to the container preserving aspect", "[geometry]")
{
    StyleParameters p;
    p.size = 100;
    p.edgeThickness = 0;

    SECTION("wide image limited by width")
    {
        const FrameGeometry g = computeFrameGeometry(cv::Size(2000, 1000), p, ContainerBounds(600, 500));
        REQUIRE(g.contentWidth == 600);
        REQUIRE(g.contentHeight == 300);
        REQUIRE(g.borderPx == 0);
        REQUIRE(g.canvasSize() == cv::Size(600, 300));
    }

    SECTION("tall image limited by height")
    {
        const FrameGeometry g = computeFrameGeometry(cv::Size(1000, 3000), p, ContainerBounds(600, 500));
        REQUIRE(g.contentHeight == 500);
        REQUIRE(g.contentWidth == 167);
    }

    SECTION("small image is never enlarged")
    {
        const FrameGeometry g = computeFrameGeometry(cv::Size(120, 80), p, ContainerBounds(600, 500));
        REQUIRE(g.contentWidth == 120);
        REQUIRE(g.contentHeight == 80);
    }
}

TEST_CASE("border never exceeds a fifth of the short side", "[geometry]")
{
    StyleParameters p;
    p.size = 100;
    p.edgeThickness = 100;
    const FrameGeometry g = computeFrameGeometry(cv::Size(500, 250), p, ContainerBounds(600, 500));
    REQUIRE(g.borderThickness == Approx(250 * kBorderFraction));
}

TEST_CASE("degenerate inputs fall back to minimum dimensions", "[geometry]")
{
    StyleParameters p;
    p.size = 0;
    p.edgeThickness = 100;

    const FrameGeometry empty = computeFrameGeometry(cv::Size(0, 0), p, ContainerBounds(0, -5));
    REQUIRE(empty.contentWidth >= 1);
    REQUIRE(empty.contentHeight >= 1);
    REQUIRE(empty.canvasWidth >= 1);
    REQUIRE(empty.canvasHeight >= 1);

    const FrameGeometry sliver = computeFrameGeometry(cv::Size(5000, 1), p, ContainerBounds(600, 500));
    REQUIRE(sliver.contentWidth <= 600);
    REQUIRE(sliver.contentHeight >= 1);
    REQUIRE(sliver.borderThickness >= 0.0);
}
