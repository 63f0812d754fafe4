/**
 * @file ToneSettings.hpp
 * Colour adjustments applied to the photo before it is laid onto the paper.
 */
#pragma once
#include <algorithm>

struct ToneSettings
{
    int brightness {100};   // percent, 0..200
    int contrast {100};     // percent, 0..200
    int sepia {0};          // percent, 0..100
    bool grayscale {false};
    bool vignette {false};
};

inline ToneSettings sanitizeToneSettings(const ToneSettings& tone)
{
    ToneSettings t = tone;
    t.brightness = std::clamp(t.brightness, 0, 200);
    t.contrast = std::clamp(t.contrast, 0, 200);
    t.sepia = std::clamp(t.sepia, 0, 100);
    return t;
}

inline bool isNeutralTone(const ToneSettings& t)
{
    return t.brightness == 100 && t.contrast == 100 && t.sepia == 0 && !t.grayscale && !t.vignette;
}
