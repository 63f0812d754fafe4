#include "util/RangeMap.hpp"
#include <cmath>

namespace util {

namespace {
    constexpr double kPi = 3.14159265358979323846;
}

double mapRange(double value, double inMin, double inMax, double outMin, double outMax)
{
    if (inMin == inMax) return outMin;
    return (value - inMin) * (outMax - outMin) / (inMax - inMin) + outMin;
}

double cosineInterpolate(double a, double b, double t)
{
    const double w = (1.0 - std::cos(t * kPi)) / 2.0;
    return a * (1.0 - w) + b * w;
}

}
