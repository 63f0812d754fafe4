#include "texture.hpp"
#include "util/ImageOps.hpp"
#include "util/RandomSource.hpp"
#include "util/RangeMap.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kMaxGrain = 18.0;
    constexpr double kMaxFiberOpacity = 0.25;
    constexpr double kFibersPerPixel = 0.001;
    constexpr double kMinFiberLength = 2.0;
    constexpr double kMaxFiberLength = 9.0;
    const cv::Scalar kFiberColor(150, 170, 180);   // muted tan, BGR

    void addGrain(cv::Mat& canvas, const cv::Mat& coverage, double amplitude, util::RandomSource& rng)
    {
        cv::Mat noise(canvas.size(), CV_32F);
        rng.fill(noise, -amplitude, amplitude);
        for (int y = 0; y < canvas.rows; ++y)
        {
            uchar* px = canvas.ptr<uchar>(y);
            const uchar* cov = coverage.ptr<uchar>(y);
            const float* n = noise.ptr<float>(y);
            for (int x = 0; x < canvas.cols; ++x, px += 4)
            {
                if (!cov[x]) continue;
                const double delta = n[x] * (cov[x] / 255.0);
                px[0] = cv::saturate_cast<uchar>(px[0] + delta);
                px[1] = cv::saturate_cast<uchar>(px[1] + delta);
                px[2] = cv::saturate_cast<uchar>(px[2] + delta);
            }
        }
    }

    void scatterFibers(cv::Mat& canvas, const cv::Mat& coverage, int count, double opacity, util::RandomSource& rng)
    {
        cv::Mat fibers = cv::Mat::zeros(canvas.size(), CV_8U);
        for (int i = 0; i < count; ++i)
        {
            const double x = rng.uniform(0.0, canvas.cols);
            const double y = rng.uniform(0.0, canvas.rows);
            const double angle = rng.uniform(0.0, kPi);
            const double len = rng.uniform(kMinFiberLength, kMaxFiberLength);
            const cv::Point2d a(x, y);
            const cv::Point2d b(x + std::cos(angle) * len, y + std::sin(angle) * len);
            cv::line(fibers, cv::Point(cvRound(a.x), cvRound(a.y)), cv::Point(cvRound(b.x), cvRound(b.y)),
                     cv::Scalar(255), 1, cv::LINE_AA);
        }
        cv::min(fibers, coverage, fibers);
        util::blendColor(canvas, fibers, kFiberColor, opacity);
    }
}

TextureSettings mapTextureSettings(double textureStrength, int canvasWidth, int canvasHeight)
{
    TextureSettings t;
    if (textureStrength <= 0.0) return t;
    t.enabled = true;
    t.grainAmplitude = util::mapRange(textureStrength, 0, 100, 0, kMaxGrain);
    t.fiberOpacity = util::mapRange(textureStrength, 0, 100, 0, kMaxFiberOpacity);
    const double area = static_cast<double>(std::max(0, canvasWidth)) * std::max(0, canvasHeight);
    t.fiberCount = static_cast<int>(std::floor(area * kFibersPerPixel * (textureStrength / 20.0)));
    return t;
}

void applyPaperTexture(cv::Mat& canvas, const cv::Mat& coverage, const TextureSettings& texture, util::RandomSource& rng)
{
    if (!texture.enabled || canvas.empty()) return;
    CV_Assert(canvas.type() == CV_8UC4 && coverage.type() == CV_8U && canvas.size() == coverage.size());
    if (texture.grainAmplitude > 0.0) addGrain(canvas, coverage, texture.grainAmplitude, rng);
    if (texture.fiberCount > 0) scatterFibers(canvas, coverage, texture.fiberCount, texture.fiberOpacity, rng);
}
