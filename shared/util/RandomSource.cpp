#include "util/RandomSource.hpp"

namespace util {

CvRandomSource::CvRandomSource()
    : rng_(static_cast<uint64>(cv::getTickCount()))
{
}

CvRandomSource::CvRandomSource(uint64_t seed)
    : rng_(static_cast<uint64>(seed))
{
}

double CvRandomSource::uniform(double lo, double hi)
{
    if (hi <= lo) return lo;
    return rng_.uniform(lo, hi);
}

void CvRandomSource::fill(cv::Mat& m, double lo, double hi)
{
    if (m.empty()) return;
    if (hi <= lo) { m.setTo(cv::Scalar::all(lo)); return; }
    rng_.fill(m, cv::RNG::UNIFORM, cv::Scalar::all(lo), cv::Scalar::all(hi));
}

}
