#pragma once

#include <cmath>
#include <limits>
#include <numbers>

namespace ef {

inline constexpr auto pi = std::numbers::pi;

template <typename T>
inline constexpr T two_pi_ = T(2) * std::numbers::pi_v<T>;

inline constexpr auto two_pi = two_pi_<double>;

template <typename T>
inline constexpr T half_pi_ = T(0.5) * std::numbers::pi_v<T>;

inline constexpr auto half_pi = half_pi_<double>;

inline constexpr auto kMaxDouble = std::numeric_limits<double>::max();
inline constexpr auto kInfDouble = std::numeric_limits<double>::infinity();
inline constexpr auto kNaN = std::numeric_limits<double>::quiet_NaN();

namespace math {

template <typename T>
inline constexpr T sgn(T val)
{
    return (T(0) < val) - (val < T(0));
}

template <class T>
inline constexpr T square(T x)
{
    return x * x;
}

// Returns a result in [0, 2pi)
template <typename T>
inline T wrap2pi(T val)
{
    T r = std::fmod(val, two_pi_<T>);
    if (r < T(0)) {
        r += two_pi_<T>;
    }
    return r;
}

template <typename T>
constexpr T degToRad(T deg)
{
    return deg * std::numbers::pi_v<T> / T(180);
}

template <typename T>
constexpr T radToDeg(T rad)
{
    return rad * T(180) / std::numbers::pi_v<T>;
}

// An ellipse is symmetric under a rotation of pi, so its position angle is
// only defined modulo pi. Returns a result in [-pi/2, pi/2)
double normalizePositionAngle(double pa);

// Area of the elliptical sector spanned from the major axis to the polar
// vector (phi, r), for an ellipse of semi-major axis sma.
double ellipseSectorArea(double sma, double eps, double phi, double r);

} // namespace math

} // namespace ef
