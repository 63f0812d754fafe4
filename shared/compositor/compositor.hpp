/*========================  compositor.hpp  ========================

   Frame assembly for the torn paper effect.
   --------------------------------------------------------------------
   Paint order, each step finishing before the next:
     1. transparent BGRA canvas at the final size
     2. shadow passes (if shadowStrength > 0)
     3. paper base fill inside the silhouette
     4. inset edge line + dashed highlight (torn outlines only)
     5. photo at the border offset, clipped to the silhouette
     6. paper grain and fibers inside the same clip

=====================================================================*/
#pragma once
#include <opencv2/opencv.hpp>
#include "models/StyleParameters.hpp"
#include "models/ToneSettings.hpp"
#include "models/ContainerBounds.hpp"
#include "edge_noise.hpp"
#include "geometry.hpp"
#include "silhouette.hpp"
#include "motion.hpp"

namespace util { class RandomSource; }

enum class PlaceholderKind
{
    NoImage = 0,
    DecodeFailed = 1,
};

constexpr int kPlaceholderWidth = 400;
constexpr int kPlaceholderHeight = 300;

struct RenderOutput
{
    cv::Mat bitmap;               // CV_8UC4
    FrameGeometry geometry;
    SilhouettePath silhouette;
    MotionHint motion;
    bool placeholder {false};
};

// Off-white paper (BGR)
const cv::Scalar kPaperColor(243, 248, 250);

// Placeholder message for each kind
const char* placeholderMessage(PlaceholderKind kind);

/**
 * @brief Render one torn paper frame.
 *
 * @param source   8-bit BGR or BGRA photo; must not be empty.
 * @param params   sanitized style controls.
 * @param tone     colour adjustments applied to the scaled photo.
 * @param bounds   display area the content is fitted into.
 * @param noise    edge profiles; empty profiles fall back to a plain rectangle.
 * @param rng      source of the tear jitter and texture scatter.
 * @param out      receives the frame; out.motion is filled from params.movement.
 * @return false if the source is empty.
 */
bool composeFrame(const cv::Mat& source, const StyleParameters& params, const ToneSettings& tone,
                  const ContainerBounds& bounds, const EdgeNoiseProfiles& noise,
                  util::RandomSource& rng, RenderOutput& out);

// Fixed-size frame with a centred message
void renderPlaceholder(PlaceholderKind kind, RenderOutput& out);
