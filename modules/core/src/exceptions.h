#pragma once

#include <stdexcept>
#include <string>

namespace ef {

// Ellipse constructed with sma <= 0 or ellipticity outside [0, 1)
class InvalidGeometry : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Mask or error array disagrees with the data shape
class ShapeMismatch : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Too few usable data points for the degrees of freedom of a model
class InsufficientData : public std::runtime_error
{
public:
    InsufficientData(const std::string& what, int available, int required)
        : std::runtime_error(what), m_available(available),
          m_required(required)
    {
    }

    int available() const { return m_available; }
    int required() const { return m_required; }

private:
    int m_available;
    int m_required;
};

// Non-linear fit ended without a usable solution
class FitFailure : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Ordering requested against an object that has no semi-major axis
class IncompatibleComparison : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace ef
