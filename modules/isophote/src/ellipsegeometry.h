#pragma once

#include <array>
#include <utility>

#include <Eigen/Core>

namespace ef {

class MaskedImage;

// Container of the geometric parameters of one candidate ellipse, plus the
// helpers the integrators need to walk along it.
//
// NOTE:
// 1. Position angle is counted counterclockwise from the +x axis, in radians,
// normalized to [-pi/2, pi/2).
// 2. Polar angles handed to radius() and sector() are measured relative to the
// major axis, in [0, 2pi).
// 3. (x0, y0) use the pixel convention of the image arrays, i.e. the center of
// the pixel at (column, row) is (column, row).
class EllipseGeometry
{
public:
    enum Param
    {
        X0,
        Y0,
        Eps,
        Pa,

        ParamCount
    };
    using FixMask = std::array<bool, ParamCount>;

    // Elliptical annulus sector used by the area integrators
    struct Sector
    {
        // Polar angle limits
        double phi1;
        double phi2;
        // Semi-major axis of the bounding ellipses
        double sma1;
        double sma2;
        double area;
        // Angular width to use for the next sector
        double nextAngularWidth;
        // Vertices in counterclockwise order, image coordinates
        std::array<Eigen::Vector2d, 4> vertices;
    };

    // Throws InvalidGeometry when sma <= 0 or eps is outside [0, 1)
    EllipseGeometry(double x0, double y0, double sma, double eps, double pa,
                    double astep = 0.1, bool linearGrowth = false,
                    const FixMask& fix = {});

    /// Properties
    inline double x0() const { return m_x0; }
    inline double y0() const { return m_y0; }
    inline double sma() const { return m_sma; }
    inline double eps() const { return m_eps; }
    inline double pa() const { return m_pa; }
    inline double astep() const { return m_astep; }
    inline bool linearGrowth() const { return m_linearGrowth; }
    inline const FixMask& fix() const { return m_fix; }
    inline bool isFixed(Param param) const { return m_fix[param]; }
    bool allFixed() const;

    void setCenter(double x0, double y0);
    // Allows 0 for the central pixel
    void setSma(double sma);
    // Unlike the constructor, negative values are accepted here so that a
    // correction crossing eps = 0 can be reflected afterwards.
    void setEps(double eps);
    void setPa(double pa);
    void setAstep(double astep);
    void setLinearGrowth(bool on);
    void setFix(const FixMask& fix);

    /// Stepping
    // Semi-major axis of the next ellipse when growing outwards.
    double updateSma(double step) const;
    // Semi-major axis of the next ellipse when walking inwards, and the
    // step that keeps doing so with updateSma().
    std::pair<double, double> resetSma(double step) const;

    // Moves every free parameter a fraction of the way back to the anchor.
    // A fraction of 1 lands exactly on the anchor.
    void unclip(const EllipseGeometry& anchor, double fraction);

    // Turns a negative ellipticity into the equivalent ellipse rotated by
    // 90 degrees.
    void reflect();

    /// Sampler helpers
    // Polar radius of the ellipse at the angle relative to the major axis.
    double radius(double angle) const;
    Eigen::Vector2d toImage(double radius, double angle) const;
    // Returns (radius, angle), the angle relative to the major axis in
    // [0, 2pi).
    std::pair<double, double> toPolar(double x, double y) const;
    // Semi-major axis of the inner and outer ellipses of the annulus.
    std::pair<double, double> boundingEllipses() const;
    Sector sector(double phi, double angularWidth) const;

    inline double sectorAngularWidth() const { return m_sectorAngularWidth; }
    inline double initialPolarAngle() const { return m_initialPolarAngle; }
    inline double initialPolarRadius() const { return m_initialPolarRadius; }

    // Moves the center to the position with the best contrast between an
    // inner and an outer circular window, scanning a box around the
    // current center. Nothing changes when the best figure of merit is
    // below the threshold. Returns whether the center moved.
    bool findCenter(const MaskedImage& image, double threshold = 0.1);

private:
    void updateSectorParameters();

private:
    double m_x0;
    double m_y0;
    double m_sma;
    double m_eps;
    double m_pa;
    double m_astep;
    bool m_linearGrowth;
    FixMask m_fix;

    // Derived from sma and astep
    double m_areaFactor{0.};
    double m_sectorAngularWidth{0.};
    double m_initialPolarAngle{0.};
    double m_initialPolarRadius{0.};
};

} // namespace ef
