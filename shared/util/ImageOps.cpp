#include "util/ImageOps.hpp"
#include <algorithm>

namespace util {

namespace {
    // Straight-alpha source-over of one pixel; colour channels in 0..255, a in 0..1
    inline void overPixel(uchar* d, double b, double g, double r, double a)
    {
        if (a <= 0.0) return;
        const double da = d[3] / 255.0;
        const double outA = a + da * (1.0 - a);
        if (outA <= 0.0) return;
        const double keep = da * (1.0 - a);
        d[0] = cv::saturate_cast<uchar>((b * a + d[0] * keep) / outA);
        d[1] = cv::saturate_cast<uchar>((g * a + d[1] * keep) / outA);
        d[2] = cv::saturate_cast<uchar>((r * a + d[2] * keep) / outA);
        d[3] = cv::saturate_cast<uchar>(outA * 255.0);
    }
}

void blendColor(cv::Mat& canvas, const cv::Mat& coverage, const cv::Scalar& bgr, double opacity)
{
    CV_Assert(canvas.type() == CV_8UC4 && coverage.type() == CV_8U && canvas.size() == coverage.size());
    opacity = std::clamp(opacity, 0.0, 1.0);
    if (opacity <= 0.0) return;
    for (int y = 0; y < canvas.rows; ++y)
    {
        uchar* row = canvas.ptr<uchar>(y);
        const uchar* cov = coverage.ptr<uchar>(y);
        for (int x = 0; x < canvas.cols; ++x)
        {
            if (!cov[x]) continue;
            overPixel(row + 4 * x, bgr[0], bgr[1], bgr[2], opacity * cov[x] / 255.0);
        }
    }
}

void blendImage(cv::Mat& canvas, const cv::Mat& image, const cv::Point& origin, const cv::Mat& coverage)
{
    CV_Assert(canvas.type() == CV_8UC4 && coverage.type() == CV_8U && canvas.size() == coverage.size());
    CV_Assert(image.type() == CV_8UC3 || image.type() == CV_8UC4);
    const cv::Rect target = cv::Rect(origin, image.size()) & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (target.empty()) return;
    const int ch = image.channels();
    for (int y = target.y; y < target.y + target.height; ++y)
    {
        uchar* row = canvas.ptr<uchar>(y);
        const uchar* cov = coverage.ptr<uchar>(y);
        const uchar* src = image.ptr<uchar>(y - origin.y);
        for (int x = target.x; x < target.x + target.width; ++x)
        {
            if (!cov[x]) continue;
            const uchar* s = src + ch * (x - origin.x);
            const double srcA = (ch == 4) ? s[3] / 255.0 : 1.0;
            overPixel(row + 4 * x, s[0], s[1], s[2], srcA * cov[x] / 255.0);
        }
    }
}

cv::Mat translateMask(const cv::Mat& mask, double dx, double dy)
{
    if (dx == 0.0 && dy == 0.0) return mask.clone();
    cv::Mat m = (cv::Mat_<double>(2, 3) << 1, 0, dx, 0, 1, dy);
    cv::Mat shifted;
    cv::warpAffine(mask, shifted, m, mask.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0));
    return shifted;
}

cv::Mat toBgr8(const cv::Mat& img)
{
    if (img.empty()) return cv::Mat();
    cv::Mat src = img;
    if (src.depth() != CV_8U)
    {
        const double scale = (src.depth() == CV_16U) ? 1.0 / 257.0 : (src.depth() == CV_32F || src.depth() == CV_64F) ? 255.0 : 1.0;
        src.convertTo(src, CV_MAKETYPE(CV_8U, src.channels()), scale);
    }
    cv::Mat bgr;
    switch (src.channels())
    {
        case 1: cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR); break;
        case 4: cv::cvtColor(src, bgr, cv::COLOR_BGRA2BGR); break;
        default: bgr = src.clone(); break;
    }
    return bgr;
}

cv::Mat flattenOnto(const cv::Mat& bgra, const cv::Scalar& background)
{
    CV_Assert(bgra.type() == CV_8UC4);
    cv::Mat out(bgra.size(), CV_8UC3, background);
    for (int y = 0; y < bgra.rows; ++y)
    {
        const uchar* s = bgra.ptr<uchar>(y);
        uchar* d = out.ptr<uchar>(y);
        for (int x = 0; x < bgra.cols; ++x, s += 4, d += 3)
        {
            const double a = s[3] / 255.0;
            for (int c = 0; c < 3; ++c)
                d[c] = cv::saturate_cast<uchar>(s[c] * a + d[c] * (1.0 - a));
        }
    }
    return out;
}

}
