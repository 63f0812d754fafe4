#include "edge_noise.hpp"
#include "util/RandomSource.hpp"
#include "util/RangeMap.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kPi = 3.14159265358979323846;

    constexpr int kMinKeyPoints = 6;
    constexpr int kMaxKeyPoints = 40;

    // Cycles across the profile and their weights; the low harmonic dominates
    constexpr double kHarmonicFreq[] = { 1.0, 2.0, 3.5 };
    constexpr double kHarmonicAmp[] = { 0.55, 0.25, 0.12 };
    constexpr double kRandomAmp = 0.30;

    // Fraction of the profile at each end over which the envelope ramps up
    constexpr double kTaper = 0.18;

    inline double envelope(double u)
    {
        const double d = std::min(u, 1.0 - u) / kTaper;
        if (d >= 1.0) return 1.0;
        return d * d * (3.0 - 2.0 * d);
    }
}

int noiseKeyPointCount(double edgeDetails)
{
    const int n = static_cast<int>(std::floor(util::mapRange(edgeDetails, 0, 100, kMinKeyPoints, kMaxKeyPoints)));
    return std::clamp(n, kMinKeyPoints, kMaxKeyPoints);
}

NoiseProfile generateNoiseProfile(int keyPoints, util::RandomSource& rng)
{
    keyPoints = std::max(2, keyPoints);
    double phase[3];
    for (double& p : phase) p = rng.uniform(0.0, 2.0 * kPi);

    NoiseProfile profile(static_cast<size_t>(keyPoints));
    for (int k = 0; k < keyPoints; ++k)
    {
        const double u = static_cast<double>(k) / (keyPoints - 1);
        double v = 0.0;
        for (int h = 0; h < 3; ++h)
            v += kHarmonicAmp[h] * std::sin(2.0 * kPi * kHarmonicFreq[h] * u + phase[h]);
        v += rng.uniform(-kRandomAmp, kRandomAmp);
        v *= envelope(u);
        profile[static_cast<size_t>(k)] = static_cast<float>(std::clamp(v, -1.0, 1.0));
    }
    return profile;
}

EdgeNoiseProfiles generateEdgeNoise(double edgeDetails, util::RandomSource& rng)
{
    const int n = noiseKeyPointCount(edgeDetails);
    EdgeNoiseProfiles p;
    p.top = generateNoiseProfile(n, rng);
    p.right = generateNoiseProfile(n, rng);
    p.bottom = generateNoiseProfile(n, rng);
    p.left = generateNoiseProfile(n, rng);
    return p;
}

bool EdgeNoiseCache::update(const StyleParameters& params, util::RandomSource& rng)
{
    if (hasProfiles() && params.edgeDetails == edgeDetails_ && params.edgeIntensity == edgeIntensity_)
        return false;
    profiles_ = generateEdgeNoise(params.edgeDetails, rng);
    edgeDetails_ = params.edgeDetails;
    edgeIntensity_ = params.edgeIntensity;
    ++generation_;
    return true;
}

void EdgeNoiseCache::reset()
{
    profiles_ = EdgeNoiseProfiles{};
    edgeDetails_ = -1.0;
    edgeIntensity_ = -1.0;
}
