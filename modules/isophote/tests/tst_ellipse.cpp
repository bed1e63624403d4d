#include <gtest/gtest.h>

#include <efIsophote/Ellipse>

#include "test_utils.h"

using namespace ef;

namespace {

MaskedImage makeSmallImage()
{
    TestImageParams params;
    params.nx = 55;
    params.ny = 55;
    params.x0 = 27.;
    params.y0 = 27.;
    params.sma = 10.;
    params.seed = 1;
    return MaskedImage{makeTestImage(params)};
}

} // namespace

TEST(Ellipse, FitImage)
{
    const MaskedImage image = makeSmallImage();
    const EllipseGeometry geometry{27., 27., 5., 0.2, 0.};

    Ellipse ellipse{image, geometry};
    Ellipse::Options options;
    options.maxsma = 27.;
    const IsophoteList isophotes = ellipse.fitImage(options);

    ASSERT_GT(isophotes.size(), 5);

    // Sorted, starting with the central pixel
    EXPECT_DOUBLE_EQ(isophotes[0].sma(), 0.);
    for (size_t i{1}; i < isophotes.size(); ++i) {
        EXPECT_LT(isophotes[i - 1].sma(), isophotes[i].sma());
    }
    EXPECT_LT(isophotes[-1].sma(), 27.);

    // Around the starting sma the fit is clean
    const Isophote& start = isophotes.closest(5.);
    EXPECT_NEAR(start.sma(), 5., 1e-9);
    EXPECT_TRUE(start.valid());
    EXPECT_TRUE(start.stopCode() == StopConverged ||
                start.stopCode() == StopMinIterations);
    EXPECT_NEAR(start.x0(), 27., 0.1);
    EXPECT_NEAR(start.y0(), 27., 0.1);

    EXPECT_GE(IsophoteList::names().size(), 30);
    EXPECT_EQ(isophotes.toTable().columnCount(), 18);
    EXPECT_GE(isophotes.toTable(IsophoteList::ColumnSet::All).columnCount(),
              30);
    EXPECT_EQ(isophotes.toTable({"sma"}).columnCount(), 1);
    EXPECT_EQ(isophotes
                  .toTable(std::vector<std::string>{"tflux_e", "tflux_c",
                                                    "npix_e", "npix_c"})
                  .columnCount(),
              4);
}

TEST(Ellipse, FitImageWithoutCentralPixel)
{
    const MaskedImage image = makeSmallImage();
    const EllipseGeometry geometry{27., 27., 5., 0.2, 0.};

    Ellipse::Options options;
    options.maxsma = 15.;
    options.minsma = 2.;
    const IsophoteList isophotes = Ellipse{image, geometry}.fitImage(options);

    ASSERT_FALSE(isophotes.empty());
    EXPECT_GT(isophotes[0].sma(), 2.);
    EXPECT_LT(isophotes[-1].sma(), 15.);
}

TEST(Ellipse, LinearGrowth)
{
    const MaskedImage image = makeSmallImage();
    const EllipseGeometry geometry{27., 27., 5., 0.2, 0.};

    const IsophoteList isophotes =
        fitImage(image, geometry, 50, 2., true, 15., 3.);

    ASSERT_GE(isophotes.size(), 3);
    for (size_t i{1}; i < isophotes.size(); ++i) {
        EXPECT_NEAR(isophotes[i].sma() - isophotes[i - 1].sma(), 2., 1e-9);
    }
}

TEST(Ellipse, FirstIsophoteConverges)
{
    const MaskedImage image = makeSmallImage();
    Ellipse ellipse{image, EllipseGeometry{27., 27., 5., 0.2, 0.}};

    // The grower runs the first isophote with twice minit
    Ellipse::Options options;
    options.minit = 20;
    const Isophote isophote = ellipse.fitIsophote(5., options);
    EXPECT_TRUE(isophote.valid());
    EXPECT_TRUE(isophote.stopCode() == StopConverged ||
                isophote.stopCode() == StopMinIterations);
    EXPECT_GE(isophote.niter(), 20);

    Ellipse::Options growOptions;
    growOptions.maxsma = 27.;
    EXPECT_FALSE(ellipse.fitImage(growOptions).empty());
}

TEST(Ellipse, SclipNeedsNclip)
{
    const MaskedImage image = makeSmallImage();
    const EllipseGeometry geometry{27., 27., 5., 0.2, 0.};

    const IsophoteList clipped =
        fitImage(image, geometry, 50, 0.1, false, 12., 3., 2.5, 2);
    ASSERT_FALSE(clipped.empty());
    const auto& options = clipped.closest(5.).sample()->options();
    EXPECT_DOUBLE_EQ(options.sclip, 2.5);
    EXPECT_EQ(options.nclip, 2);

    const IsophoteList unclipped =
        fitImage(image, geometry, 50, 0.1, false, 12., 3., 2.5);
    ASSERT_FALSE(unclipped.empty());
    EXPECT_EQ(unclipped.closest(5.).sample()->options().nclip, 0);
}

TEST(Ellipse, ReplacedGeometryKeepsValidity)
{
    const MaskedImage image = makeSmallImage();
    const EllipseGeometry geometry{27.5, 26.5, 10., 0.3, 0.2};
    const EllipseGeometry reference{27., 27., 8., 0.2, 0.};

    auto sample = std::make_shared<EllipseSample>(image, 10., geometry);
    sample->update(geometry.fix());

    const Isophote diverged{sample, 12, false, StopDiverged};
    const Isophote replaced =
        replaceGeometry(image, diverged, reference, 0.7);
    EXPECT_FALSE(replaced.valid());
    EXPECT_EQ(replaced.stopCode(), StopGeometryReplaced);
    EXPECT_EQ(replaced.niter(), 12);
    EXPECT_DOUBLE_EQ(replaced.sma(), 10.);
    EXPECT_DOUBLE_EQ(replaced.x0(), 27.);
    EXPECT_DOUBLE_EQ(replaced.y0(), 27.);
    EXPECT_DOUBLE_EQ(replaced.eps(), 0.2);

    const Isophote abandoned{sample, 5, true, StopAbandoned};
    EXPECT_TRUE(replaceGeometry(image, abandoned, reference, 0.7).valid());
}

TEST(Ellipse, FitSingleIsophote)
{
    const MaskedImage image = makeSmallImage();
    Ellipse ellipse{image, EllipseGeometry{27., 27., 5., 0.2, 0.}};

    const Isophote isophote = ellipse.fitIsophote(10.);
    EXPECT_DOUBLE_EQ(isophote.sma(), 10.);
    EXPECT_TRUE(isophote.valid());
    EXPECT_NEAR(isophote.intens(), 200., 2.);

    const Isophote central = ellipse.fitIsophote(0.);
    EXPECT_DOUBLE_EQ(central.sma(), 0.);

    Ellipse::Options options;
    options.maxrit = 8.;
    const Isophote noniterative = ellipse.fitIsophote(10., options);
    EXPECT_EQ(noniterative.stopCode(), StopNonIterative);
    EXPECT_EQ(noniterative.niter(), 0);
}

TEST(Ellipse, EverythingFixed)
{
    const MaskedImage image = makeSmallImage();
    Ellipse ellipse{image, EllipseGeometry{27., 27., 5., 0.2, 0.}};

    Ellipse::Options options;
    options.fixCenter = true;
    options.fixPa = true;
    options.fixEps = true;
    EXPECT_TRUE(ellipse.fitImage(options).empty());
}

TEST(Ellipse, FixedCenter)
{
    const MaskedImage image = makeSmallImage();
    Ellipse ellipse{image, EllipseGeometry{27.2, 26.9, 5., 0.2, 0.}};

    Ellipse::Options options;
    options.maxsma = 15.;
    options.fixCenter = true;
    const IsophoteList isophotes = ellipse.fitImage(options);

    ASSERT_FALSE(isophotes.empty());
    for (const auto& isophote : isophotes) {
        EXPECT_DOUBLE_EQ(isophote.x0(), 27.2);
        EXPECT_DOUBLE_EQ(isophote.y0(), 26.9);
    }
}

TEST(Ellipse, DefaultGeometryIsCentered)
{
    const MaskedImage image = makeSmallImage();
    const Ellipse ellipse{image};

    EXPECT_NEAR(ellipse.geometry().x0(), 27., 1.5);
    EXPECT_NEAR(ellipse.geometry().y0(), 27., 1.5);
    EXPECT_DOUBLE_EQ(ellipse.geometry().sma(), 10.);
}

TEST(Ellipse, OptionsJson)
{
    Ellipse::Options options;
    options.sma0 = 12.;
    options.maxsma = 80.;
    options.step = 0.2;
    options.nclip = 2;
    options.integrMode = IntegrationMode::Median;
    options.fixPa = true;
    options.failurePolicy = Ellipse::FailurePolicy::Record;

    const nlohmann::json json = options;
    EXPECT_EQ(json["integrmode"], "Median");
    EXPECT_TRUE(json["maxrit"].is_null());

    const auto restored = json.get<Ellipse::Options>();
    EXPECT_EQ(restored.sma0, options.sma0);
    EXPECT_EQ(restored.maxsma, options.maxsma);
    EXPECT_FALSE(restored.maxrit.has_value());
    EXPECT_FALSE(restored.linear.has_value());
    EXPECT_DOUBLE_EQ(restored.step, 0.2);
    EXPECT_EQ(restored.nclip, 2);
    EXPECT_EQ(restored.integrMode, IntegrationMode::Median);
    EXPECT_TRUE(restored.fixPa);
    EXPECT_FALSE(restored.fixEps);
    EXPECT_EQ(restored.failurePolicy, Ellipse::FailurePolicy::Record);
}
