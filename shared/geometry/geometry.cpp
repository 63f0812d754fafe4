#include "geometry.hpp"
#include "util/RangeMap.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kMinContentScale = 0.01;
}

double contentScaleFor(double size)
{
    return std::max(kMinContentScale, util::mapRange(size, 10, 100, 0.2, 1.0));
}

FrameGeometry computeFrameGeometry(const cv::Size& imageSize, const StyleParameters& params, const ContainerBounds& bounds)
{
    FrameGeometry g;
    const double imgW = std::max(1, imageSize.width);
    const double imgH = std::max(1, imageSize.height);
    const double maxW = std::max(kMinContainerSide, bounds.width);
    const double maxH = std::max(kMinContainerSide, bounds.height);

    g.contentScale = contentScaleFor(params.size);
    double w = imgW * g.contentScale;
    double h = imgH * g.contentScale;
    const double aspect = w / h;

    if (w > maxW) { w = maxW; h = w / aspect; }
    if (h > maxH) { h = maxH; w = h * aspect; }

    g.contentWidth = std::max(1, static_cast<int>(std::lround(w)));
    g.contentHeight = std::max(1, static_cast<int>(std::lround(h)));

    const double shortSide = std::min(g.contentWidth, g.contentHeight);
    g.borderThickness = std::max(0.0, util::mapRange(params.edgeThickness, 0, 100, 0, shortSide * kBorderFraction));
    g.borderPx = static_cast<int>(std::lround(g.borderThickness));
    g.canvasWidth = g.contentWidth + 2 * g.borderPx;
    g.canvasHeight = g.contentHeight + 2 * g.borderPx;
    return g;
}
