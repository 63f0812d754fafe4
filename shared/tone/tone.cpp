#include "tone.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace
{
    // Standard sepia weights, rows/cols in BGR order
    cv::Mat sepiaKernel()
    {
        return (cv::Mat_<float>(3, 3) <<
            0.131f, 0.534f, 0.272f,
            0.168f, 0.686f, 0.349f,
            0.189f, 0.769f, 0.393f);
    }

    // Darken toward the corners; factor 1 inside kInner of the half-diagonal
    void applyVignette(cv::Mat& f)
    {
        constexpr double kInner = 0.45;
        constexpr double kStrength = 0.55;
        const double cx = (f.cols - 1) / 2.0, cy = (f.rows - 1) / 2.0;
        const double maxR = std::max(1.0, std::hypot(cx, cy));
        for (int y = 0; y < f.rows; ++y)
        {
            cv::Vec3f* row = f.ptr<cv::Vec3f>(y);
            for (int x = 0; x < f.cols; ++x)
            {
                const double r = std::hypot(x - cx, y - cy) / maxR;
                double t = std::clamp((r - kInner) / (1.0 - kInner), 0.0, 1.0);
                t = t * t * (3.0 - 2.0 * t);
                row[x] *= static_cast<float>(1.0 - kStrength * t);
            }
        }
    }
}

void applyTone(const cv::Mat& img, cv::Mat& out, const ToneSettings& toneIn)
{
    const ToneSettings tone = sanitizeToneSettings(toneIn);
    if (img.empty() || isNeutralTone(tone)) { out = img; return; }
    CV_Assert(img.type() == CV_8UC3 || img.type() == CV_8UC4);

    cv::Mat color, alpha;
    if (img.channels() == 4)
    {
        std::vector<cv::Mat> ch; cv::split(img, ch);
        alpha = ch[3];
        ch.pop_back();
        cv::merge(ch, color);
    }
    else color = img;

    cv::Mat f; color.convertTo(f, CV_32FC3, 1.0 / 255.0);

    if (tone.grayscale)
    {
        cv::Mat g; cv::cvtColor(f, g, cv::COLOR_BGR2GRAY);
        cv::cvtColor(g, f, cv::COLOR_GRAY2BGR);
    }
    if (tone.sepia > 0)
    {
        const double s = tone.sepia / 100.0;
        cv::Mat sep; cv::transform(f, sep, sepiaKernel());
        cv::addWeighted(f, 1.0 - s, sep, s, 0.0, f);
    }
    if (tone.brightness != 100) f *= tone.brightness / 100.0;
    if (tone.contrast != 100)
    {
        const double c = tone.contrast / 100.0;
        f.convertTo(f, CV_32FC3, c, 0.5 * (1.0 - c));
    }
    if (tone.vignette) applyVignette(f);

    cv::Mat result; f.convertTo(result, CV_8UC3, 255.0);
    if (!alpha.empty())
    {
        std::vector<cv::Mat> ch; cv::split(result, ch);
        ch.push_back(alpha);
        cv::merge(ch, result);
    }
    out = result;
}
