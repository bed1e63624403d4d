#include "math.h"

namespace ef {

namespace math {

double normalizePositionAngle(double pa)
{
    double r = std::fmod(pa + half_pi, pi);
    if (r < 0.) {
        r += pi;
    }

    // fmod may round up to exactly pi for tiny negative inputs
    if (r >= pi) {
        r -= pi;
    }

    return r - half_pi;
}

double ellipseSectorArea(double sma, double eps, double phi, double r)
{
    double aux = r * std::cos(phi) / sma;
    if (std::abs(aux) >= 1.) {
        aux = sgn(aux);
    }

    return std::abs(square(sma) * (1. - eps) / 2. * std::acos(aux));
}

} // namespace math

} // namespace ef
