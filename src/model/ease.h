#pragma once

namespace heatcast {

/// Cubic ease-in-out: 4x^3 below 0.5, (x-1)(2x-2)^2 + 1 from 0.5 up.
/// Flat near both ends, steep in the middle. x is expected in [0,1] and is
/// not clamped here.
double easeInOutCubic(double x);

}  // namespace heatcast
