#pragma once

#include <any>
#include <array>
#include <memory>
#include <optional>
#include <string_view>

#include "ellipsesample.h"
#include "fitstatemachine.h"

namespace ef {

// Every numeric field of an isophote, in table order
enum class IsophoteField
{
    Sma,
    Intens,
    IntErr,
    Eps,
    EllipErr,
    Pa,
    PaErr,
    X0,
    X0Err,
    Y0,
    Y0Err,
    Grad,
    GradError,
    GradRError,
    A3,
    B3,
    A4,
    B4,
    A3Err,
    B3Err,
    A4Err,
    B4Err,
    Rms,
    PixStddev,
    Sarea,
    Ndata,
    Nflag,
    Niter,
    Valid,
    StopCode,
    TfluxE,
    TfluxC,
    NpixE,
    NpixC,

    Count
};

inline constexpr auto kIsophoteFieldCount =
    static_cast<size_t>(IsophoteField::Count);

// Attribute names, e.g. "int_err"
std::string_view fieldName(IsophoteField field);
std::optional<IsophoteField> fieldFromName(std::string_view name);
// Position angles are reported in degrees in tables
bool isAngleField(IsophoteField field);

// Result of fitting one ellipse.
//
// NOTE:
// 1. Isophotes are ordered by semi-major axis only, two isophotes whose sma
// agree within kSmaTolerance compare equal.
// 2. The sample is shared and never modified after construction.
class Isophote
{
public:
    static constexpr double kSmaTolerance{1e-9};

    Isophote(std::shared_ptr<const EllipseSample> sample, int niter,
             bool valid, int stopCode);

    // Isophote of zero length at the center, from a CentralEllipseSample
    static Isophote centralPixel(std::shared_ptr<const EllipseSample> sample);

    /// Geometry
    inline double sma() const { return m_sma; }
    inline double eps() const { return m_eps; }
    inline double pa() const { return m_pa; }
    inline double x0() const { return m_x0; }
    inline double y0() const { return m_y0; }
    inline const EllipseGeometry& geometry() const
    {
        return m_sample->geometry();
    }

    /// Fit status
    inline int niter() const { return m_niter; }
    inline bool valid() const { return m_valid; }
    inline int stopCode() const { return m_stopCode; }

    /// Photometry
    inline double intens() const { return m_intens; }
    double rms() const;
    double intErr() const;
    double pixStddev() const;
    inline double grad() const { return m_grad; }
    inline const std::optional<double>& gradError() const
    {
        return m_gradError;
    }
    inline const std::optional<double>& gradRError() const
    {
        return m_gradRError;
    }
    inline double sarea() const { return m_sarea; }
    inline int ndata() const { return m_ndata; }
    inline int nflag() const { return m_nflag; }

    /// Errors
    inline double x0Err() const { return m_x0Err; }
    inline double y0Err() const { return m_y0Err; }
    inline double ellipErr() const { return m_ellipErr; }
    inline double paErr() const { return m_paErr; }

    /// Deviations from a perfect ellipse, NaN when they can't be fitted
    inline double a3() const { return m_a3; }
    inline double b3() const { return m_b3; }
    inline double a4() const { return m_a4; }
    inline double b4() const { return m_b4; }
    inline double a3Err() const { return m_a3Err; }
    inline double b3Err() const { return m_b3Err; }
    inline double a4Err() const { return m_a4Err; }
    inline double b4Err() const { return m_b4Err; }

    /// Fluxes inside the ellipse and inside the circle of radius sma
    inline double tfluxE() const { return m_tfluxE; }
    inline double tfluxC() const { return m_tfluxC; }
    inline int npixE() const { return m_npixE; }
    inline int npixC() const { return m_npixC; }

    inline const std::shared_ptr<const EllipseSample>& sample() const
    {
        return m_sample;
    }

    // Any field as a double, missing values are NaN and booleans 0 or 1
    double value(IsophoteField field) const;

    // Negative, zero or positive as this sma is smaller, equal or larger.
    int compare(const Isophote& other) const;
    // Throws IncompatibleComparison unless other holds an Isophote.
    int compare(const std::any& other) const;

    bool operator==(const Isophote& other) const { return compare(other) == 0; }
    bool operator!=(const Isophote& other) const { return compare(other) != 0; }
    bool operator<(const Isophote& other) const { return compare(other) < 0; }
    bool operator>(const Isophote& other) const { return compare(other) > 0; }
    bool operator<=(const Isophote& other) const { return compare(other) <= 0; }
    bool operator>=(const Isophote& other) const { return compare(other) >= 0; }

private:
    Isophote() = default;

    void computeFluxes();
    void computeErrors();
    // Returns [a, b, a_err, b_err] of the harmonic of the given order
    std::array<double, 4> computeDeviations(int order) const;

private:
    std::shared_ptr<const EllipseSample> m_sample;

    double m_sma{0.};
    double m_eps{0.};
    double m_pa{0.};
    double m_x0{0.};
    double m_y0{0.};

    int m_niter{0};
    bool m_valid{false};
    int m_stopCode{StopFailed};

    double m_intens{0.};
    double m_grad{0.};
    std::optional<double> m_gradError;
    std::optional<double> m_gradRError;
    double m_sarea{0.};
    int m_ndata{0};
    int m_nflag{0};

    double m_x0Err{0.};
    double m_y0Err{0.};
    double m_ellipErr{0.};
    double m_paErr{0.};

    double m_a3{0.}, m_b3{0.}, m_a4{0.}, m_b4{0.};
    double m_a3Err{0.}, m_b3Err{0.}, m_a4Err{0.}, m_b4Err{0.};

    double m_tfluxE{0.};
    double m_tfluxC{0.};
    int m_npixE{0};
    int m_npixC{0};

    bool m_central{false};
};

} // namespace ef
