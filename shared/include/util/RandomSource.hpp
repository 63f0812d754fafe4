#pragma once
#include <opencv2/opencv.hpp>
#include <cstdint>

namespace util {

// Source of every random draw made while rendering. Tests pass a seeded
// instance so tear geometry and texture scatter are reproducible.
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    // Uniform sample in [lo, hi)
    virtual double uniform(double lo, double hi) = 0;

    // Fill a single-channel float matrix with uniform samples in [lo, hi)
    virtual void fill(cv::Mat& m, double lo, double hi) = 0;
};

// cv::RNG backed source. The default constructor seeds from the tick counter.
class CvRandomSource : public RandomSource
{
public:
    CvRandomSource();
    explicit CvRandomSource(uint64_t seed);

    double uniform(double lo, double hi) override;
    void fill(cv::Mat& m, double lo, double hi) override;

private:
    cv::RNG rng_;
};

}
