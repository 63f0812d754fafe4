#include "shadow.hpp"
#include "util/ImageOps.hpp"
#include "util/RangeMap.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>

namespace
{
    constexpr double kMaxOffset = 25.0;
    constexpr double kMaxBlur = 50.0;
    constexpr double kMaxOpacity = 0.75;

    constexpr double kPenumbraOffset = 1.5;
    constexpr double kPenumbraBlur = 2.0;
    constexpr double kPenumbraMinBlur = 4.0;
    constexpr double kPenumbraOpacity = 0.35;

    void paintPass(cv::Mat& canvas, const cv::Mat& coverage, const ShadowPass& pass)
    {
        if (pass.opacity <= 0.0) return;
        cv::Mat mask = util::translateMask(coverage, pass.offsetX, pass.offsetY);
        if (pass.blur > 0.0)
        {
            const double sigma = pass.blur / 2.0;
            cv::GaussianBlur(mask, mask, cv::Size(0, 0), sigma, sigma, cv::BORDER_CONSTANT);
        }
        util::blendColor(canvas, mask, cv::Scalar(0, 0, 0), pass.opacity);
    }
}

ShadowSettings mapShadowSettings(const StyleParameters& params)
{
    ShadowSettings s;
    s.primary.offsetX = util::mapRange(params.shadowOffsetX, 0, 100, -kMaxOffset, kMaxOffset);
    s.primary.offsetY = util::mapRange(params.shadowOffsetY, 0, 100, -kMaxOffset, kMaxOffset);
    s.primary.blur = util::mapRange(params.shadowBlur, 0, 100, 0, kMaxBlur);
    s.primary.opacity = util::mapRange(params.shadowStrength, 0, 100, 0, kMaxOpacity);
    s.enabled = s.primary.opacity > 0.0;

    s.penumbra.offsetX = s.primary.offsetX * kPenumbraOffset;
    s.penumbra.offsetY = s.primary.offsetY * kPenumbraOffset;
    s.penumbra.blur = std::max(kPenumbraMinBlur, s.primary.blur * kPenumbraBlur);
    s.penumbra.opacity = s.primary.opacity * kPenumbraOpacity;
    return s;
}

void paintShadow(cv::Mat& canvas, const cv::Mat& coverage, const ShadowSettings& shadow)
{
    if (!shadow.enabled) return;
    paintPass(canvas, coverage, shadow.penumbra);
    paintPass(canvas, coverage, shadow.primary);
}
