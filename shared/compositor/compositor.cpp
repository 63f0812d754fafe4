#include "compositor.hpp"
#include "shadow.hpp"
#include "texture.hpp"
#include "tone.hpp"
#include "util/ImageOps.hpp"
#include <algorithm>
#include <iostream>

namespace
{
    constexpr double kEdgeLineOpacity = 0.08;
    constexpr int kEdgeLineThickness = 2;
    constexpr double kHighlightOpacity = 0.22;
    constexpr double kHighlightInset = 1.5;
    constexpr int kHighlightDash = 3;

    const cv::Scalar kPlaceholderBackground(245, 245, 245);
    const cv::Scalar kMutedText(120, 113, 107);
    const cv::Scalar kErrorText(40, 40, 200);

    // Dark line just inside the tear, then a faint broken light ridge next to it
    void paintEdgeDepth(cv::Mat& canvas, const cv::Mat& coverage, const SilhouettePath& path)
    {
        cv::Mat line = strokeSilhouette(path, canvas.size(), kEdgeLineThickness);
        cv::min(line, coverage, line);
        util::blendColor(canvas, line, cv::Scalar(0, 0, 0), kEdgeLineOpacity);

        cv::Mat ridge = strokeSilhouette(path, canvas.size(), 1, kHighlightInset, kHighlightDash);
        cv::min(ridge, coverage, ridge);
        util::blendColor(canvas, ridge, cv::Scalar(255, 255, 255), kHighlightOpacity);
    }

    cv::Mat scaleContent(const cv::Mat& source, const cv::Size& size)
    {
        if (source.size() == size) return source;
        const int interp = (size.width < source.cols) ? cv::INTER_AREA : cv::INTER_LANCZOS4;
        cv::Mat scaled; cv::resize(source, scaled, size, 0, 0, interp);
        return scaled;
    }
}

const char* placeholderMessage(PlaceholderKind kind)
{
    switch (kind)
    {
        case PlaceholderKind::DecodeFailed: return "Could not load image. Please try a different file.";
        case PlaceholderKind::NoImage:
        default: return "Upload an image to see the preview";
    }
}

bool composeFrame(const cv::Mat& source, const StyleParameters& params, const ToneSettings& tone,
                  const ContainerBounds& bounds, const EdgeNoiseProfiles& noise,
                  util::RandomSource& rng, RenderOutput& out)
{
    if (source.empty()) { std::cerr << "[composeFrame] empty source\n"; return false; }

    out = RenderOutput{};
    out.motion = mapMotion(params.movement);
    out.geometry = computeFrameGeometry(source.size(), params, bounds);
    const FrameGeometry& g = out.geometry;

    // 1. canvas
    cv::Mat canvas(g.canvasSize(), CV_8UC4, cv::Scalar(0, 0, 0, 0));

    out.silhouette = buildSilhouette(g, params, noise, rng);
    const cv::Mat coverage = rasterizeSilhouette(out.silhouette, canvas.size());

    // 2. shadow
    paintShadow(canvas, coverage, mapShadowSettings(params));

    // 3. paper
    util::blendColor(canvas, coverage, kPaperColor, 1.0);

    // 4. edge depth
    if (out.silhouette.torn) paintEdgeDepth(canvas, coverage, out.silhouette);

    // 5. photo
    cv::Mat content = scaleContent(source, g.contentSize());
    cv::Mat toned; applyTone(content, toned, tone);
    util::blendImage(canvas, toned, g.contentRect().tl(), coverage);

    // 6. texture
    applyPaperTexture(canvas, coverage, mapTextureSettings(params.textureStrength, g.canvasWidth, g.canvasHeight), rng);

    out.bitmap = canvas;
    return true;
}

void renderPlaceholder(PlaceholderKind kind, RenderOutput& out)
{
    out = RenderOutput{};
    out.placeholder = true;
    out.geometry.contentScale = 0.0;
    out.geometry.contentWidth = out.geometry.canvasWidth = kPlaceholderWidth;
    out.geometry.contentHeight = out.geometry.canvasHeight = kPlaceholderHeight;
    out.silhouette = rectangleSilhouette(out.geometry.canvasSize());

    cv::Mat bgr(kPlaceholderHeight, kPlaceholderWidth, CV_8UC3, kPlaceholderBackground);
    const std::string text = placeholderMessage(kind);
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const int thickness = 1;
    double scale = 0.5;
    int baseline = 0;
    cv::Size ts = cv::getTextSize(text, font, scale, thickness, &baseline);
    const int maxTextW = kPlaceholderWidth - 24;
    if (ts.width > maxTextW)
    {
        scale *= static_cast<double>(maxTextW) / ts.width;
        ts = cv::getTextSize(text, font, scale, thickness, &baseline);
    }
    const cv::Point org((kPlaceholderWidth - ts.width) / 2, (kPlaceholderHeight + ts.height) / 2);
    const cv::Scalar color = (kind == PlaceholderKind::DecodeFailed) ? kErrorText : kMutedText;
    cv::putText(bgr, text, org, font, scale, color, thickness, cv::LINE_AA);

    cv::cvtColor(bgr, out.bitmap, cv::COLOR_BGR2BGRA);
}
