/**
 * @file StyleParameters.hpp
 * Torn-paper style controls shared by the render session and the CLI.
 * Every value sits on a 0..100 slider scale; the shadow offsets treat 50 as zero.
 */
#pragma once
#include <algorithm>
#include <cmath>

struct StyleParameters
{
    // Content
    double size {80.0};            // content scale factor
    double edgeThickness {35.0};   // border width

    // Tear
    double edgeIntensity {50.0};   // tear depth
    double edgeDetails {50.0};     // key-point / segment density
    double cutoutStyle {30.0};     // fine fibrous jitter

    // Paper
    double textureStrength {20.0};

    // Shadow
    double shadowOffsetX {60.0};
    double shadowOffsetY {65.0};
    double shadowBlur {30.0};
    double shadowStrength {40.0};

    // Floating animation
    double movement {20.0};
};

// Clamp every control into [0, 100]; NaN becomes 0.
inline StyleParameters sanitizeStyleParameters(const StyleParameters& params)
{
    auto clampSlider = [](double v) { return std::isnan(v) ? 0.0 : std::clamp(v, 0.0, 100.0); };
    StyleParameters p = params;
    p.size = clampSlider(p.size);
    p.edgeThickness = clampSlider(p.edgeThickness);
    p.edgeIntensity = clampSlider(p.edgeIntensity);
    p.edgeDetails = clampSlider(p.edgeDetails);
    p.cutoutStyle = clampSlider(p.cutoutStyle);
    p.textureStrength = clampSlider(p.textureStrength);
    p.shadowOffsetX = clampSlider(p.shadowOffsetX);
    p.shadowOffsetY = clampSlider(p.shadowOffsetY);
    p.shadowBlur = clampSlider(p.shadowBlur);
    p.shadowStrength = clampSlider(p.shadowStrength);
    p.movement = clampSlider(p.movement);
    return p;
}
