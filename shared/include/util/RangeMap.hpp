#pragma once

namespace util {

// Linear remap of value from [inMin, inMax] onto [outMin, outMax].
// A collapsed input range (inMin == inMax) yields outMin.
double mapRange(double value, double inMin, double inMax, double outMin, double outMax);

// Blend a -> b using (1 - cos(t*pi)) / 2 as the weight, t in [0, 1]
double cosineInterpolate(double a, double b, double t);

}
