/*========================  edge_noise.hpp  ========================

   Per-edge noise profiles for the torn paper silhouette.
   --------------------------------------------------------------------
   • one profile per side (top, right, bottom, left), samples in [-1, 1]
   • low-frequency sine harmonics plus a smaller random perturbation
   • amplitude tapers to zero at both ends so neighbouring sides meet
     cleanly at the corners
   • tear depth (edgeIntensity) is applied later by the silhouette builder

=====================================================================*/
#pragma once
#include <cstdint>
#include <vector>
#include "models/StyleParameters.hpp"

namespace util { class RandomSource; }

using NoiseProfile = std::vector<float>;

struct EdgeNoiseProfiles
{
    NoiseProfile top;
    NoiseProfile right;
    NoiseProfile bottom;
    NoiseProfile left;

    bool empty() const { return top.empty() || right.empty() || bottom.empty() || left.empty(); }
};

// Key points per profile for an edgeDetails slider value (6..40)
int noiseKeyPointCount(double edgeDetails);

// Build a single profile of the given length
NoiseProfile generateNoiseProfile(int keyPoints, util::RandomSource& rng);

// Build all four profiles together
EdgeNoiseProfiles generateEdgeNoise(double edgeDetails, util::RandomSource& rng);

/**
 * @brief Holds the session's profiles and regenerates them only when the
 *        controls that shape them change.
 *
 * The cache is keyed by (edgeDetails, edgeIntensity). Any other parameter
 * change leaves the profiles untouched so the tear does not jump around
 * while the user moves unrelated sliders.
 */
class EdgeNoiseCache
{
public:
    // Returns true when the profiles were regenerated
    bool update(const StyleParameters& params, util::RandomSource& rng);
    void reset();

    bool hasProfiles() const { return !profiles_.empty(); }
    const EdgeNoiseProfiles& profiles() const { return profiles_; }
    // Incremented on every regeneration
    uint64_t generation() const { return generation_; }

private:
    EdgeNoiseProfiles profiles_;
    double edgeDetails_ {-1.0};
    double edgeIntensity_ {-1.0};
    uint64_t generation_ {0};
};
