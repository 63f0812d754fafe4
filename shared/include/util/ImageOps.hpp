#pragma once
#include <opencv2/opencv.hpp>

namespace util {

// All canvases are CV_8UC4 (BGRA, straight alpha). Coverage masks are CV_8U,
// canvas-sized, 0 = untouched and 255 = fully covered.

// Source-over a solid colour through a coverage mask at the given opacity
void blendColor(cv::Mat& canvas, const cv::Mat& coverage, const cv::Scalar& bgr, double opacity);

// Source-over an image (BGR or BGRA) with its top-left at origin; coverage is
// canvas-sized and clips the paste
void blendImage(cv::Mat& canvas, const cv::Mat& image, const cv::Point& origin, const cv::Mat& coverage);

// Shift a coverage mask by a sub-pixel offset; pixels shifted in are zero
cv::Mat translateMask(const cv::Mat& mask, double dx, double dy);

// Convert grey / BGRA / 16-bit input to 8-bit BGR
cv::Mat toBgr8(const cv::Mat& img);

// Composite a BGRA canvas over an opaque background colour
cv::Mat flattenOnto(const cv::Mat& bgra, const cv::Scalar& background);

}
