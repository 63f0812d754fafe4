#include "silhouette.hpp"
#include "util/RandomSource.hpp"
#include "util/RangeMap.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr int kFixedShift = 4;                      // sub-pixel bits for fillPoly / line
    constexpr double kFixedScale = 1 << kFixedShift;
    constexpr double kMinBorderForTear = 0.01;
    constexpr double kPhotoClearance = 1.0;            // px kept between the deepest tear and the photo

    inline cv::Point toFixed(const cv::Point2d& p)
    {
        return cv::Point(cvRound(p.x * kFixedScale), cvRound(p.y * kFixedScale));
    }

    inline cv::Point2d midpoint(const cv::Point2d& a, const cv::Point2d& b)
    {
        return (a + b) * 0.5;
    }

    // Closed midpoint smoothing: each anchor becomes the control point of a
    // curve running between the midpoints of its two neighbouring chords
    std::vector<CurveSegment> smoothClosed(const std::vector<cv::Point2d>& pts)
    {
        std::vector<CurveSegment> segs;
        const size_t m = pts.size();
        if (m < 3) return segs;
        segs.reserve(m);
        for (size_t k = 0; k < m; ++k)
        {
            const cv::Point2d& prev = pts[(k + m - 1) % m];
            const cv::Point2d& cur = pts[k];
            const cv::Point2d& next = pts[(k + 1) % m];
            segs.push_back({ midpoint(prev, cur), cur, midpoint(cur, next) });
        }
        return segs;
    }
}

std::vector<cv::Point2d> SilhouettePath::flatten(int stepsPerSegment) const
{
    stepsPerSegment = std::max(1, stepsPerSegment);
    std::vector<cv::Point2d> out;
    out.reserve(segments.size() * static_cast<size_t>(stepsPerSegment));
    for (const CurveSegment& s : segments)
    {
        for (int i = 0; i < stepsPerSegment; ++i)
        {
            const double t = static_cast<double>(i) / stepsPerSegment;
            const double u = 1.0 - t;
            out.push_back(s.start * (u * u) + s.control * (2.0 * u * t) + s.end * (t * t));
        }
    }
    return out;
}

TearSettings mapTearSettings(const StyleParameters& params, const FrameGeometry& geometry)
{
    TearSettings t;
    const double border = geometry.borderThickness;
    t.enabled = border > kMinBorderForTear && geometry.borderPx >= 1 && params.edgeIntensity > 0.0;
    t.numSegments = std::max(5, static_cast<int>(std::floor(util::mapRange(params.edgeDetails, 0, 100, 10, 50))));
    t.baseMaxDeviation = util::mapRange(params.edgeIntensity, 0, 100, 0, border * kTearDepthFraction);
    t.jitterStrength = util::mapRange(params.cutoutStyle, 0, 100, 0, t.baseMaxDeviation * kJitterFraction);
    // The photo sits at the rounded border, so the band is measured in whole pixels
    t.nominalInset = geometry.borderPx / 2.0;
    t.deviationLimit = std::max(0.0, std::min(t.nominalInset * 0.99, geometry.borderPx - t.nominalInset - kPhotoClearance));
    return t;
}

double sampleProfile(const NoiseProfile& profile, int i, int n)
{
    if (profile.empty() || n <= 0) return 0.0;
    const int keyPoints = static_cast<int>(profile.size());
    if (keyPoints == 1) return profile[0];
    const double progress = std::clamp(static_cast<double>(i) / n, 0.0, 1.0);
    const double kf = progress * (keyPoints - 1);
    const int k = std::min(static_cast<int>(std::floor(kf)), keyPoints - 1);
    const double y1 = profile[static_cast<size_t>(k)];
    const double y2 = profile[static_cast<size_t>(std::min(k + 1, keyPoints - 1))];
    return util::cosineInterpolate(y1, y2, kf - k);
}

SilhouettePath rectangleSilhouette(const cv::Size& canvas)
{
    SilhouettePath path;
    const double w = canvas.width, h = canvas.height;
    path.anchors = { { 0, 0 }, { w, 0 }, { w, h }, { 0, h } };
    path.deviations.assign(4, 0.0);
    path.sides = { EdgeSide::Top, EdgeSide::Right, EdgeSide::Bottom, EdgeSide::Left };
    for (size_t k = 0; k < 4; ++k)
    {
        const cv::Point2d& a = path.anchors[k];
        const cv::Point2d& b = path.anchors[(k + 1) % 4];
        path.segments.push_back({ a, midpoint(a, b), b });
    }
    return path;
}

SilhouettePath buildSilhouette(const FrameGeometry& geometry, const StyleParameters& params,
                               const EdgeNoiseProfiles& noise, util::RandomSource& rng)
{
    const TearSettings tear = mapTearSettings(params, geometry);
    if (!tear.enabled || noise.empty())
        return rectangleSilhouette(geometry.canvasSize());

    const int n = tear.numSegments;
    const double base = tear.baseMaxDeviation;
    const double jitter = tear.jitterStrength;
    const double limit = tear.deviationLimit;

    const double x0 = tear.nominalInset;
    const double y0 = tear.nominalInset;
    const double x1 = geometry.canvasWidth - tear.nominalInset;
    const double y1 = geometry.canvasHeight - tear.nominalInset;

    auto deviationAt = [&](const NoiseProfile& profile, int i) {
        const double d = sampleProfile(profile, i, n) * base + rng.uniform(-jitter, jitter);
        return std::clamp(d, -limit, limit);
    };
    // Small shift along the edge; corners stay put so the sides join
    auto slideAt = [&](int i) {
        return i == 0 ? 0.0 : rng.uniform(-0.5 * jitter, 0.5 * jitter);
    };
    auto lerp = [](double a, double b, double t) { return a + (b - a) * t; };

    SilhouettePath path;
    path.torn = true;
    path.anchors.reserve(static_cast<size_t>(4 * n));
    auto push = [&](const cv::Point2d& p, double dev, EdgeSide side) {
        path.anchors.push_back(p);
        path.deviations.push_back(dev);
        path.sides.push_back(side);
    };

    for (int i = 0; i < n; ++i)
    {
        const double t = static_cast<double>(i) / n;
        const double x = lerp(x0, x1, t) + slideAt(i);
        const double d = deviationAt(noise.top, i);
        push({ x, y0 - d }, d, EdgeSide::Top);
    }
    for (int i = 0; i < n; ++i)
    {
        const double t = static_cast<double>(i) / n;
        const double y = lerp(y0, y1, t) + slideAt(i);
        const double d = deviationAt(noise.right, i);
        push({ x1 + d, y }, d, EdgeSide::Right);
    }
    for (int i = 0; i < n; ++i)
    {
        const double t = static_cast<double>(i) / n;
        const double x = lerp(x1, x0, t) + slideAt(i);
        const double d = deviationAt(noise.bottom, i);
        push({ x, y1 + d }, d, EdgeSide::Bottom);
    }
    for (int i = 0; i < n; ++i)
    {
        const double t = static_cast<double>(i) / n;
        const double y = lerp(y1, y0, t) + slideAt(i);
        const double d = deviationAt(noise.left, i);
        push({ x0 - d, y }, d, EdgeSide::Left);
    }

    path.segments = smoothClosed(path.anchors);
    return path;
}

cv::Mat rasterizeSilhouette(const SilhouettePath& path, const cv::Size& canvas)
{
    if (!path.torn) return cv::Mat(canvas, CV_8U, cv::Scalar(255));

    cv::Mat coverage = cv::Mat::zeros(canvas, CV_8U);
    const std::vector<cv::Point2d> pts = path.flatten();
    if (pts.size() < 3) return coverage;
    std::vector<std::vector<cv::Point>> poly(1);
    poly[0].reserve(pts.size());
    for (const cv::Point2d& p : pts) poly[0].push_back(toFixed(p));
    cv::fillPoly(coverage, poly, cv::Scalar(255), cv::LINE_AA, kFixedShift);
    return coverage;
}

cv::Mat strokeSilhouette(const SilhouettePath& path, const cv::Size& canvas, int thickness,
                         double inset, int dashLength)
{
    cv::Mat stroke = cv::Mat::zeros(canvas, CV_8U);
    std::vector<cv::Point2d> pts = path.flatten();
    const size_t m = pts.size();
    if (m < 3) return stroke;

    if (inset != 0.0)
    {
        // Walk order is clockwise on screen, so the inward normal of tangent (tx, ty) is (-ty, tx)
        std::vector<cv::Point2d> moved(m);
        for (size_t k = 0; k < m; ++k)
        {
            const cv::Point2d tan = pts[(k + 1) % m] - pts[(k + m - 1) % m];
            const double len = std::hypot(tan.x, tan.y);
            moved[k] = len > 0.0 ? pts[k] + cv::Point2d(-tan.y, tan.x) * (inset / len) : pts[k];
        }
        pts.swap(moved);
    }

    thickness = std::max(1, thickness);
    if (dashLength <= 0)
    {
        std::vector<std::vector<cv::Point>> poly(1);
        for (const cv::Point2d& p : pts) poly[0].push_back(toFixed(p));
        cv::polylines(stroke, poly, true, cv::Scalar(255), thickness, cv::LINE_AA, kFixedShift);
        return stroke;
    }
    for (size_t k = 0; k < m; ++k)
    {
        if ((k / static_cast<size_t>(dashLength)) % 2 != 0) continue;
        cv::line(stroke, toFixed(pts[k]), toFixed(pts[(k + 1) % m]), cv::Scalar(255), thickness, cv::LINE_AA, kFixedShift);
    }
    return stroke;
}
