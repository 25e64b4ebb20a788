#include "model/ease.h"

namespace heatcast {

double easeInOutCubic(double x) {
    if (x < 0.5) return 4.0 * x * x * x;
    const double t = 2.0 * x - 2.0;
    return (x - 1.0) * t * t + 1.0;
}

}  // namespace heatcast
