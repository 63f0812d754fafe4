#pragma once
#include "models/ToneSettings.hpp"
namespace cv { class Mat; }

// Apply brightness / contrast / sepia / grayscale / vignette to an 8-bit BGR or
// BGRA image. Alpha is carried through untouched. Neutral settings hand the
// input back unchanged.
void applyTone(const cv::Mat& img, cv::Mat& out, const ToneSettings& tone);
