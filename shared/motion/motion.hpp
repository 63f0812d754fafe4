#pragma once

// Floating-card animation handed to the presentation layer; never rendered
// into the bitmap. When enabled is false the loop must not run at all.
struct MotionHint
{
    double amplitude {0.0};   // vertical travel, px
    double period {15.0};     // seconds per loop
    bool enabled {false};
};

constexpr double kMaxMotionAmplitude = 12.0;
constexpr double kSlowMotionPeriod = 15.0;
constexpr double kFastMotionPeriod = 5.0;

MotionHint mapMotion(double movement);
