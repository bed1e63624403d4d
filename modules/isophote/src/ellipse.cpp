#include "ellipse.h"

#include <algorithm>

#include <glog/logging.h>
#include <magic_enum.hpp>

#include <efCore/Exceptions>
#include <efCore/Math>

#include "ellipsefitter.h"
#include "ellipsesample.h"

namespace ef {

namespace {

// Inwards walk never goes below this sma, the central pixel aside
constexpr double kMinInwardSma{0.5};

// Consecutive recorded failures ending a walk direction
constexpr int kMaxConsecutiveFailures{2};

bool isFlagged(const Isophote& isophote, double fflag)
{
    return isophote.ndata() < fflag * (isophote.ndata() + isophote.nflag());
}

// Needs fixing by a neighbor geometry
bool isAbnormal(const Isophote& isophote, double fflag)
{
    return isophote.stopCode() == StopAbandoned ||
           isophote.stopCode() == StopDiverged || isFlagged(isophote, fflag);
}

} // namespace

///------- Ellipse::Impl starts from here
class Ellipse::Impl
{
public:
    Impl(const MaskedImage& image, const EllipseGeometry& geometry);

    Isophote fitIsophote(double sma, const EllipseGeometry& seed,
                         const Options& opts, int minit, bool noniterate,
                         bool goingInwards) const;
    Isophote fitCentralPixel(const EllipseGeometry& seed) const;
    Isophote nonIterative(double sma, const EllipseGeometry& seed,
                          const Options& opts) const;

    // Re-samples the last isophote with the center, ellipticity and
    // position angle of list[neighbor].
    void fixLastIsophote(std::vector<Isophote>& list, size_t neighbor,
                         const Options& opts) const;

    // Working copy of the geometry with the call options applied
    EllipseGeometry prepareGeometry(const Options& opts) const;

    static EllipseSample::Options sampleOptions(const Options& opts);

public:
    MaskedImage m_image;
    EllipseGeometry m_geometry;
};

Ellipse::Impl::Impl(const MaskedImage& image, const EllipseGeometry& geometry)
    : m_image(image), m_geometry(geometry)
{
}

EllipseSample::Options Ellipse::Impl::sampleOptions(const Options& opts)
{
    EllipseSample::Options sampleOpts;
    sampleOpts.integrMode = opts.integrMode;
    sampleOpts.sclip = opts.sclip;
    sampleOpts.nclip = opts.nclip;
    return sampleOpts;
}

EllipseGeometry Ellipse::Impl::prepareGeometry(const Options& opts) const
{
    EllipseGeometry geometry = m_geometry;
    geometry.setAstep(std::abs(opts.step));
    if (opts.linear.has_value()) {
        geometry.setLinearGrowth(opts.linear.value());
    }

    if (opts.fixCenter || opts.fixPa || opts.fixEps) {
        EllipseGeometry::FixMask fix;
        fix[EllipseGeometry::X0] = opts.fixCenter;
        fix[EllipseGeometry::Y0] = opts.fixCenter;
        fix[EllipseGeometry::Eps] = opts.fixEps;
        fix[EllipseGeometry::Pa] = opts.fixPa;
        geometry.setFix(fix);
    }

    return geometry;
}

Isophote Ellipse::Impl::fitIsophote(double sma, const EllipseGeometry& seed,
                                    const Options& opts, int minit,
                                    bool noniterate, bool goingInwards) const
{
    if (sma <= 0.) {
        return fitCentralPixel(seed);
    }

    if (noniterate || (opts.maxrit.has_value() && sma > opts.maxrit.value())) {
        return nonIterative(sma, seed, opts);
    }

    auto sample = std::make_shared<EllipseSample>(m_image, sma, seed,
                                                  sampleOptions(opts));

    EllipseFitter::Options fitterOpts;
    fitterOpts.conver = opts.conver;
    fitterOpts.minit = minit;
    fitterOpts.maxit = opts.maxit;
    fitterOpts.fflag = opts.fflag;
    fitterOpts.maxgerr = opts.maxgerr;
    fitterOpts.maxUnclip = opts.maxUnclip;
    fitterOpts.goingInwards = goingInwards;

    EllipseFitter fitter{sample};
    return fitter.fit(fitterOpts);
}

Isophote Ellipse::Impl::fitCentralPixel(const EllipseGeometry& seed) const
{
    auto sample = std::make_shared<CentralEllipseSample>(m_image, seed);
    CentralEllipseFitter fitter{sample};
    return fitter.fit();
}

Isophote Ellipse::Impl::nonIterative(double sma, const EllipseGeometry& seed,
                                     const Options& opts) const
{
    auto sample = std::make_shared<EllipseSample>(m_image, sma, seed,
                                                  sampleOptions(opts));
    try {
        sample->update(seed.fix());
    }
    catch (const InsufficientData& e) {
        LOG(WARNING) << e.what();
        return {sample, 0, false, StopFailed};
    }

    return {sample, 0, true, StopNonIterative};
}

void Ellipse::Impl::fixLastIsophote(std::vector<Isophote>& list,
                                    size_t neighbor, const Options& opts) const
{
    CHECK_LT(neighbor + 1, list.size());

    list.back() = replaceGeometry(m_image, list.back(),
                                  list[neighbor].geometry(), opts.fflag);
}

///------- Ellipse starts from here
Ellipse::Ellipse(const MaskedImage& image,
                 const std::optional<EllipseGeometry>& geometry,
                 double threshold)
    : d(std::make_unique<Impl>(
          image, geometry.value_or(EllipseGeometry{image.cols() / 2.,
                                                   image.rows() / 2., 10.,
                                                   0.2, half_pi})))
{
    if (!geometry.has_value()) {
        d->m_geometry.findCenter(d->m_image, threshold);
    }
}

Ellipse::~Ellipse() = default;

const MaskedImage& Ellipse::image() const { return d->m_image; }

const EllipseGeometry& Ellipse::geometry() const { return d->m_geometry; }

IsophoteList Ellipse::fitImage(const Options& opts)
{
    if (opts.fixCenter && opts.fixPa && opts.fixEps) {
        LOG(WARNING) << "Everything is fixed. Fit not possible.";
        return {};
    }

    const EllipseGeometry geometry = d->prepareGeometry(opts);
    const bool record = opts.failurePolicy == FailurePolicy::Record;

    std::vector<Isophote> list;

    // Outwards from the starting sma
    double sma = opts.sma0.value_or(geometry.sma());
    EllipseGeometry seed = geometry;
    bool noiter{false};
    bool first{true};
    int failures{0};
    while (true) {
        // The first isophote runs longer
        const int minit = first ? 2 * opts.minit : opts.minit;
        first = false;

        const Isophote isophote =
            d->fitIsophote(sma, seed, opts, minit, noiter, false);
        VLOG(1) << "Outwards sma = " << isophote.sma()
                << ", stop code = " << isophote.stopCode();

        if (isophote.stopCode() == StopFailed) {
            if (list.empty()) {
                LOG(WARNING) << "No meaningful fit was possible.";
                return {};
            }
            if (!record) {
                break;
            }

            list.push_back(isophote);
            if (++failures >= kMaxConsecutiveFailures) {
                break;
            }
        }
        else {
            failures = 0;
            list.push_back(isophote);

            if (isAbnormal(isophote, opts.fflag)) {
                // Failed right at the outset, the starting guess is too far
                // off
                if (list.size() == 1) {
                    LOG(WARNING) << "No meaningful fit was possible.";
                    return {};
                }

                d->fixLastIsophote(list, list.size() - 2, opts);

                // Two consecutive unstable isophotes, or too many flagged
                // points: stop iterating, or stop growing
                const auto& last = list.back();
                if (list.size() > 2 &&
                    ((last.stopCode() == StopGeometryReplaced &&
                      list[list.size() - 2].stopCode() ==
                          StopGeometryReplaced) ||
                     isFlagged(last, opts.fflag))) {
                    if (opts.maxsma.has_value() &&
                        opts.maxsma.value() > last.sma()) {
                        noiter = true;
                    }
                    else {
                        break;
                    }
                }
            }

            if (opts.minIntensity.has_value() &&
                list.back().intens() < opts.minIntensity.value()) {
                break;
            }
        }

        seed = list.back().geometry();
        sma = seed.updateSma(opts.step);
        if (opts.maxsma.has_value() && sma >= opts.maxsma.value()) {
            break;
        }
    }

    // Inwards, starting from the first outwards isophote
    seed = list.front().geometry();
    const auto [innerSma, innerStep] = seed.resetSma(opts.step);
    sma = innerSma;
    failures = 0;
    while (sma > std::max(opts.minsma, kMinInwardSma)) {
        const Isophote isophote =
            d->fitIsophote(sma, seed, opts, opts.minit, false, true);
        VLOG(1) << "Inwards sma = " << isophote.sma()
                << ", stop code = " << isophote.stopCode();

        if (isophote.stopCode() == StopFailed) {
            // Usually too few points at very small radii
            if (!record) {
                break;
            }

            list.push_back(isophote);
            if (++failures >= kMaxConsecutiveFailures) {
                break;
            }
        }
        else {
            failures = 0;
            list.push_back(isophote);
            if (isophote.stopCode() == StopAbandoned ||
                isophote.stopCode() == StopDiverged) {
                d->fixLastIsophote(list, 0, opts);
            }
        }

        seed = list.back().geometry();
        sma = seed.updateSma(innerStep);
    }

    if (opts.minsma == 0.) {
        list.push_back(d->fitCentralPixel(seed));
    }

    IsophoteList result{std::move(list)};
    result.sort();

    LOG(INFO) << "Fitted " << result.size() << " isophotes, sma from "
              << result.front().sma() << " to " << result.back().sma();

    return result;
}

Isophote Ellipse::fitIsophote(double sma, const Options& opts)
{
    return d->fitIsophote(sma, d->prepareGeometry(opts), opts, opts.minit,
                          false, false);
}

///------- Options IO starts from here
namespace key {
constexpr char kSma0[]{"sma0"};
constexpr char kMinSma[]{"minsma"};
constexpr char kMaxSma[]{"maxsma"};
constexpr char kStep[]{"step"};
constexpr char kConver[]{"conver"};
constexpr char kMinIt[]{"minit"};
constexpr char kMaxIt[]{"maxit"};
constexpr char kFflag[]{"fflag"};
constexpr char kMaxGerr[]{"maxgerr"};
constexpr char kMaxUnclip[]{"max_unclip"};
constexpr char kSclip[]{"sclip"};
constexpr char kNclip[]{"nclip"};
constexpr char kIntegrMode[]{"integrmode"};
constexpr char kLinear[]{"linear"};
constexpr char kMaxRit[]{"maxrit"};
constexpr char kFixCenter[]{"fix_center"};
constexpr char kFixPa[]{"fix_pa"};
constexpr char kFixEps[]{"fix_eps"};
constexpr char kMinIntensity[]{"min_intensity"};
constexpr char kFailurePolicy[]{"failure_policy"};
} // namespace key

namespace {

template <typename T>
void toOptionalJson(nlohmann::json& j, const char* key,
                    const std::optional<T>& value)
{
    if (value.has_value()) {
        j[key] = value.value();
    }
    else {
        j[key] = nullptr;
    }
}

template <typename T>
void fromOptionalJson(const nlohmann::json& j, const char* key,
                      std::optional<T>& value)
{
    if (j.contains(key) && !j.at(key).is_null()) {
        value = j.at(key).get<T>();
    }
    else {
        value.reset();
    }
}

} // namespace

void to_json(nlohmann::json& j, const Ellipse::Options& opts)
{
    toOptionalJson(j, key::kSma0, opts.sma0);
    j[key::kMinSma] = opts.minsma;
    toOptionalJson(j, key::kMaxSma, opts.maxsma);
    j[key::kStep] = opts.step;
    j[key::kConver] = opts.conver;
    j[key::kMinIt] = opts.minit;
    j[key::kMaxIt] = opts.maxit;
    j[key::kFflag] = opts.fflag;
    j[key::kMaxGerr] = opts.maxgerr;
    j[key::kMaxUnclip] = opts.maxUnclip;
    j[key::kSclip] = opts.sclip;
    j[key::kNclip] = opts.nclip;
    j[key::kIntegrMode] = magic_enum::enum_name(opts.integrMode);
    toOptionalJson(j, key::kLinear, opts.linear);
    toOptionalJson(j, key::kMaxRit, opts.maxrit);
    j[key::kFixCenter] = opts.fixCenter;
    j[key::kFixPa] = opts.fixPa;
    j[key::kFixEps] = opts.fixEps;
    toOptionalJson(j, key::kMinIntensity, opts.minIntensity);
    j[key::kFailurePolicy] = magic_enum::enum_name(opts.failurePolicy);
}

void from_json(const nlohmann::json& j, Ellipse::Options& opts)
{
    fromOptionalJson(j, key::kSma0, opts.sma0);
    j.at(key::kMinSma).get_to(opts.minsma);
    fromOptionalJson(j, key::kMaxSma, opts.maxsma);
    j.at(key::kStep).get_to(opts.step);
    j.at(key::kConver).get_to(opts.conver);
    j.at(key::kMinIt).get_to(opts.minit);
    j.at(key::kMaxIt).get_to(opts.maxit);
    j.at(key::kFflag).get_to(opts.fflag);
    j.at(key::kMaxGerr).get_to(opts.maxgerr);
    j.at(key::kMaxUnclip).get_to(opts.maxUnclip);
    j.at(key::kSclip).get_to(opts.sclip);
    j.at(key::kNclip).get_to(opts.nclip);
    opts.integrMode = magic_enum::enum_cast<IntegrationMode>(
                          j.at(key::kIntegrMode).get<std::string>())
                          .value_or(IntegrationMode::Bilinear);
    fromOptionalJson(j, key::kLinear, opts.linear);
    fromOptionalJson(j, key::kMaxRit, opts.maxrit);
    j.at(key::kFixCenter).get_to(opts.fixCenter);
    j.at(key::kFixPa).get_to(opts.fixPa);
    j.at(key::kFixEps).get_to(opts.fixEps);
    fromOptionalJson(j, key::kMinIntensity, opts.minIntensity);
    opts.failurePolicy = magic_enum::enum_cast<Ellipse::FailurePolicy>(
                             j.at(key::kFailurePolicy).get<std::string>())
                             .value_or(Ellipse::FailurePolicy::Stop);
}

///------- Free functions starts from here
Isophote replaceGeometry(const MaskedImage& image, const Isophote& isophote,
                         const EllipseGeometry& reference, double fflag)
{
    EllipseGeometry geometry = isophote.geometry();
    geometry.setCenter(reference.x0(), reference.y0());
    geometry.setEps(reference.eps());
    geometry.setPa(reference.pa());

    auto sample = std::make_shared<EllipseSample>(
        image, isophote.sma(), geometry, isophote.sample()->options());
    try {
        sample->update(geometry.fix());
    }
    catch (const InsufficientData& e) {
        LOG(WARNING) << "Failed to re-sample the isophote at sma = "
                     << isophote.sma() << ": " << e.what();
        return isophote;
    }

    const int stopCode =
        isFlagged(isophote, fflag) ? StopSoft : StopGeometryReplaced;
    return {sample, isophote.niter(), isophote.valid(), stopCode};
}

IsophoteList fitImage(const MaskedImage& image,
                      const EllipseGeometry& geometry, int maxit, double step,
                      bool linearGrowth, std::optional<double> maxsma,
                      double minsma, double sclip, int nclip)
{
    Ellipse::Options opts;
    opts.maxit = maxit;
    opts.step = step;
    opts.linear = linearGrowth;
    opts.maxsma = maxsma;
    opts.minsma = minsma;
    opts.sclip = sclip;
    opts.nclip = nclip;

    Ellipse ellipse{image, geometry};
    return ellipse.fitImage(opts);
}

} // namespace ef
