/*========================  silhouette.hpp  ========================

   Torn paper outline, built as plain geometry before anything is painted.
   --------------------------------------------------------------------
   • buildSilhouette() walks top -> right -> bottom -> left, sampling the
     edge noise profiles, and smooths the samples into quadratic curves
   • the nominal edge runs through the middle of the border band, so a
     tear never reaches into the photo nor past the canvas
   • rasterizeSilhouette() / strokeSilhouette() are the only paint-side
     entry points

=====================================================================*/
#pragma once
#include <opencv2/opencv.hpp>
#include <vector>
#include "models/StyleParameters.hpp"
#include "edge_noise.hpp"
#include "geometry.hpp"

namespace util { class RandomSource; }

enum class EdgeSide
{
    Top = 0,
    Right = 1,
    Bottom = 2,
    Left = 3,
};

// Quadratic Bezier from start to end pulled toward control
struct CurveSegment
{
    cv::Point2d start;
    cv::Point2d control;
    cv::Point2d end;
};

struct SilhouettePath
{
    // Sampled outline points in walk order (clockwise from the top-left corner)
    std::vector<cv::Point2d> anchors;
    // Signed perpendicular offset of each anchor from its nominal edge, positive outward
    std::vector<double> deviations;
    std::vector<EdgeSide> sides;
    // Closed chain of curves through the anchors
    std::vector<CurveSegment> segments;
    bool torn {false};

    // Polyline approximation of the closed curve
    std::vector<cv::Point2d> flatten(int stepsPerSegment = 4) const;
};

struct TearSettings
{
    bool enabled {false};
    int numSegments {5};
    double baseMaxDeviation {0.0};
    double jitterStrength {0.0};
    double nominalInset {0.0};
    double deviationLimit {0.0};    // clamp on |deviation| keeping the tear off the photo and the canvas edge
};

// Share of the border the noise-driven tear may use
constexpr double kTearDepthFraction = 0.45;
// Fibrous jitter as a share of the tear depth
constexpr double kJitterFraction = 0.10;

TearSettings mapTearSettings(const StyleParameters& params, const FrameGeometry& geometry);

// Deviation sampled from a profile at segment i of n, before jitter and scaling
double sampleProfile(const NoiseProfile& profile, int i, int n);

SilhouettePath buildSilhouette(const FrameGeometry& geometry, const StyleParameters& params,
                               const EdgeNoiseProfiles& noise, util::RandomSource& rng);

// Plain canvas rectangle, used when there is no tear to draw
SilhouettePath rectangleSilhouette(const cv::Size& canvas);

// Anti-aliased CV_8U coverage of the filled silhouette
cv::Mat rasterizeSilhouette(const SilhouettePath& path, const cv::Size& canvas);

// Anti-aliased CV_8U coverage of the outline; dashLength > 0 draws every other run of that many points
cv::Mat strokeSilhouette(const SilhouettePath& path, const cv::Size& canvas, int thickness,
                         double inset = 0.0, int dashLength = 0);
