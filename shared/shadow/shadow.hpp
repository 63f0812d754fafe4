#pragma once
#include "models/StyleParameters.hpp"
namespace cv { class Mat; }

// One cast-shadow pass, in pixels
struct ShadowPass
{
    double offsetX {0.0};
    double offsetY {0.0};
    double blur {0.0};      // comparable to a canvas shadowBlur: sigma = blur / 2
    double opacity {0.0};
};

struct ShadowSettings
{
    ShadowPass primary;
    ShadowPass penumbra;    // wider, fainter pass painted underneath
    bool enabled {false};
};

// Slider values -> pixel space. Offsets span -25..25 px around the 50 midpoint,
// blur 0..50 px, opacity 0..0.75.
ShadowSettings mapShadowSettings(const StyleParameters& params);

// Paint the penumbra then the primary shadow of the silhouette coverage onto a
// BGRA canvas. Must run before the paper is filled.
void paintShadow(cv::Mat& canvas, const cv::Mat& coverage, const ShadowSettings& shadow);
