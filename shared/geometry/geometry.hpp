#pragma once
#include <opencv2/opencv.hpp>
#include "models/StyleParameters.hpp"
#include "models/ContainerBounds.hpp"

// Smallest container side accepted; smaller (or non-positive) bounds are raised to it
constexpr int kMinContainerSide = 16;
// Border is at most this fraction of the content's short side
constexpr double kBorderFraction = 0.20;

struct FrameGeometry
{
    double contentScale {1.0};
    int contentWidth {1};
    int contentHeight {1};
    double borderThickness {0.0};   // exact border from the edgeThickness slider
    int borderPx {0};               // border rounded to whole pixels
    int canvasWidth {1};
    int canvasHeight {1};

    cv::Size canvasSize() const { return cv::Size(canvasWidth, canvasHeight); }
    cv::Size contentSize() const { return cv::Size(contentWidth, contentHeight); }
    cv::Rect contentRect() const { return cv::Rect(borderPx, borderPx, contentWidth, contentHeight); }
};

// Scale factor applied to the source for a given size slider value
double contentScaleFor(double size);

/**
 * @brief Fit the scaled image into the container and derive the border.
 *
 * The image is scaled by contentScaleFor(size) and then shrunk (never
 * enlarged) to the container width, then to its height, preserving aspect.
 * A zero-sized image is treated as 1x1.
 */
FrameGeometry computeFrameGeometry(const cv::Size& imageSize, const StyleParameters& params, const ContainerBounds& bounds);
