#include "motion.hpp"
#include "util/RangeMap.hpp"

MotionHint mapMotion(double movement)
{
    MotionHint m;
    m.amplitude = util::mapRange(movement, 0, 100, 0, kMaxMotionAmplitude);
    m.period = util::mapRange(movement, 0, 100, kSlowMotionPeriod, kFastMotionPeriod);
    m.enabled = movement > 0.0;
    if (!m.enabled) m.amplitude = 0.0;
    return m;
}
