// Unit tests for the spectrum algebra: scalar operations, resampling,
// spectrum-spectrum arithmetic, comparison and slit convolution

#include "../testing.h"

#include <common/errors.h>
#include <spectrum/compare.h>
#include <spectrum/operations.h>
#include <spectrum/quantities.h>
#include <spectrum/resample.h>
#include <spectrum/slit.h>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

template <typename A, typename B>
concept Multipliable = requires(const A& a, const B& b) { a * b; };
template <typename A, typename B>
concept Divisible = requires(const A& a, const B& b) { a / b; };

// Products of two spectra must not compile
static_assert(!Multipliable<specalg::Spectrum, specalg::Spectrum>);
static_assert(!Divisible<specalg::Spectrum, specalg::Spectrum>);
static_assert(Multipliable<specalg::Spectrum, double>);
static_assert(Divisible<specalg::Spectrum, specalg::Scalar>);

TEST_CASE("spectrum container")
{
    const Eigen::ArrayXd axis { linearAxis(11, 400.0, 500.0) };

    SECTION("Construction")
    {
        const specalg::Spectrum s { axis, "nm", "radiance_noslit",
                                    Eigen::ArrayXd::Ones(11) };
        CHECK(s.size() == 11);
        CHECK(s.unit("radiance_noslit") == "mW/cm2/sr/nm");
        CHECK(s.axisKind() == specalg::AxisKind::wavelength);
        CHECK(s.quantityNames()
              == std::vector<std::string> { "radiance_noslit" });
        CHECK_THROWS_AS((specalg::Spectrum { Eigen::ArrayXd {}, "nm" }),
                        specalg::ValueError);
        Eigen::ArrayXd bad_axis { axis };
        bad_axis(3) = bad_axis(2);
        CHECK_THROWS_AS((specalg::Spectrum { bad_axis, "nm" }),
                        specalg::ValueError);
        CHECK_THROWS_AS((specalg::Spectrum { axis, "mW" }),
                        specalg::UnitError);
        // Descending axes are valid
        const specalg::Spectrum descending { axis.reverse(), "nm" };
        CHECK(descending.axis()(0) == 500.0);
    }

    SECTION("Quantities")
    {
        specalg::Spectrum s { axis, "nm" };
        s.setQuantity("radiance", Eigen::ArrayXd::Ones(11), "mW/cm2/sr/nm");
        CHECK_THROWS_AS(
          s.setQuantity("transmittance", Eigen::ArrayXd::Ones(3), ""),
          specalg::ValueError);
        CHECK_THROWS_AS(s.get("absorbance"), specalg::KeyError);
        s.convertUnit("radiance", "W/m2/sr/nm");
        CHECK_THAT(s.get("radiance")(0), WithinRel(10.0, 1e-12));
        s.setUnit("radiance", "count");
        CHECK(s.unit("radiance") == "count");
        CHECK_THAT(s.get("radiance")(0), WithinRel(10.0, 1e-12));
        CHECK_THAT(s.integral(), WithinRel(1000.0, 1e-12));
        CHECK_THAT(s.max(), WithinRel(10.0, 1e-12));
        s.removeQuantity("radiance");
        CHECK(s.nQuantities() == 0);
        CHECK_THROWS_AS(s.selectQuantity(), specalg::KeyError);
    }

    SECTION("Axis in another unit")
    {
        const specalg::Spectrum s { axis, "nm" };
        const Eigen::ArrayXd wavenumbers { s.axisIn("cm-1") };
        CHECK_THAT(wavenumbers(0), WithinRel(25000.0, 1e-12));
        CHECK_THAT(wavenumbers(10), WithinRel(20000.0, 1e-12));
        CHECK_THAT(s.axisIn("um")(10), WithinRel(0.5, 1e-12));
    }

    SECTION("Quantity registry")
    {
        CHECK(specalg::isConvolved("radiance"));
        CHECK_FALSE(specalg::isConvolved("radiance_noslit"));
        CHECK(specalg::transparentValue("transmittance_noslit") == 1.0);
        CHECK(specalg::convolvedCounterpart("radiance_noslit") == "radiance");
        CHECK_FALSE(specalg::convolvedCounterpart("absorbance"));
        CHECK_THROWS_AS(specalg::quantityInfo("brightness"),
                        specalg::ValueError);
        CHECK(specalg::knownQuantities().size() == 7);
    }
}

TEST_CASE("scalar algebra")
{
    const Eigen::ArrayXd axis { linearAxis(21, 400.0, 500.0) };
    const specalg::Spectrum s { makeRadiance(
      axis, 0.5 + gaussianLine(axis, 450.0, 10.0)) };

    SECTION("Identity laws")
    {
        CHECK(specalg::addConstant(s, { 0.0, "mW/cm2/sr/nm" }) == s);
        CHECK(specalg::multiply(s, 1.0) == s);
        const specalg::Spectrum scaled { 3 * s / 3 };
        CHECK(scaled == s);
        const specalg::Spectrum shifted { (1 + s) - 1 };
        CHECK(shifted == s);
        const specalg::Spectrum negated { -(-s) };
        CHECK(negated == s);
        CHECK(specalg::multiply(s, 2.0) != s);
    }

    SECTION("Identity laws on a line without continuum")
    {
        // The far wings are below the rounding error of 1 + s
        const Eigen::ArrayXd fine_axis { linearAxis(201, 400.0, 500.0) };
        const specalg::Spectrum line { makeRadiance(
          fine_axis, gaussianLine(fine_axis, 450.0, 5.0)) };
        const specalg::Spectrum shifted { (1 + line) - 1 };
        REQUIRE(shifted.get("radiance")(0) == 0.0);
        CHECK(shifted == line);
        CHECK(specalg::Spectrum { 3 * line / 3 } == line);
        CHECK(specalg::Spectrum { -(-line) } == line);
        CHECK(specalg::multiply(line, 1.0 + 1e-3) != line);
        // Strictly relative comparison of every sample
        specalg::CompareOptions strict {};
        strict.peak_floor = false;
        CHECK_FALSE(specalg::compareWith(shifted, line, {}, strict));
    }

    SECTION("Unit-carrying scalars")
    {
        const specalg::Spectrum added { s + specalg::Scalar { 1.0,
                                                              "W/m2/sr/nm" } };
        CHECK_THAT(added.get("radiance")(0) - s.get("radiance")(0),
                   WithinRel(0.1, 1e-12));
        CHECK_THROWS_AS(s + specalg::Scalar(1.0, "K"), specalg::UnitError);
        const specalg::Spectrum per_area { s * specalg::Scalar { 2.0, "cm2" } };
        CHECK(per_area.unit("radiance") == "mW/(nm sr)");
        CHECK(per_area.get("radiance")(3) == 2.0 * s.get("radiance")(3));
    }

    SECTION("Count calibration")
    {
        specalg::Spectrum counts { s };
        counts.setUnit("radiance", "count");
        const specalg::Spectrum calibrated {
            counts * specalg::Scalar { 100.0, "mW/cm2/sr/nm/count" }
        };
        CHECK(calibrated.unit("radiance") == "mW/(cm2 nm sr)");
        CHECK_THAT(calibrated.get("radiance")(5),
                   WithinRel(100.0 * s.get("radiance")(5), 1e-14));
    }

    SECTION("Division normalizes to a dimensionless ratio")
    {
        const specalg::Spectrum ratio { s
                                        / specalg::Scalar { 2.0,
                                                            "W/m2/sr/nm" } };
        CHECK(ratio.unit("radiance").empty());
        CHECK_THAT(ratio.get("radiance")(0),
                   WithinRel(5.0 * s.get("radiance")(0), 1e-12));
    }

    SECTION("Multiplication round trip")
    {
        const double k { 7.3 };
        const specalg::Spectrum back { specalg::multiply(
          specalg::multiply(s, k), 1.0 / k) };
        CHECK_THAT(back.integral(), WithinRel(s.integral(), 1e-10));
    }

    SECTION("In-place operators mutate the operand")
    {
        specalg::Spectrum t { s };
        t *= 2.0;
        t += 1.0;
        t -= 1.0;
        t /= 2.0;
        CHECK(t == s);
        t += specalg::Scalar { 10.0, "mW/cm2/sr/nm" };
        CHECK_THAT(t.get("radiance")(0),
                   WithinRel(s.get("radiance")(0) + 10.0, 1e-12));
    }

    SECTION("Ambiguous quantity")
    {
        specalg::Spectrum both { s };
        both.setQuantity("transmittance", Eigen::ArrayXd::Ones(21), "");
        CHECK_THROWS_AS(both * 2.0, specalg::KeyError);
        CHECK_THROWS_AS(both + 1.0, specalg::KeyError);
        // The failed call leaves the operand unmodified
        CHECK_THROWS_AS(both *= 2.0, specalg::KeyError);
        CHECK(both.get("radiance")(0) == s.get("radiance")(0));
        // Naming the quantity resolves the ambiguity
        const specalg::Spectrum doubled { specalg::multiply(
          both, 2.0, "radiance") };
        CHECK(doubled.get("radiance")(0) == 2.0 * s.get("radiance")(0));
        CHECK(doubled.get("transmittance")(0) == 1.0);
    }

    SECTION("Crop")
    {
        const specalg::Spectrum cropped { specalg::crop(s, 420.0, 455.0) };
        CHECK(cropped.axis().minCoeff() >= 420.0);
        CHECK(cropped.axis().maxCoeff() <= 455.0);
        CHECK(cropped.size() == 8);
        // Bounds in wavenumber, i.e. 416.67 to 476.19 nm
        const specalg::Spectrum by_wavenumber { specalg::crop(
          s, 21000.0, 24000.0, "cm-1") };
        CHECK(by_wavenumber.axis()(0) == 420.0);
        CHECK(by_wavenumber.axis()(by_wavenumber.size() - 1) == 475.0);
        const specalg::Spectrum open_ended { specalg::crop(s, 480.0, {}) };
        CHECK(open_ended.size() == 5);
        CHECK_THROWS_AS(specalg::crop(s, 455.0, 420.0), specalg::ValueError);
        CHECK_THROWS_AS(specalg::crop(s, 401.0, 404.0), specalg::RangeError);
        specalg::Spectrum t { s };
        CHECK_THROWS_AS(t.crop(600.0, 700.0), specalg::RangeError);
        CHECK(t.size() == 21);
        t.crop(450.0, {});
        CHECK(t.size() == 11);
    }

    SECTION("Offset")
    {
        const specalg::Spectrum shifted { specalg::offset(
          s, 0.002, "um", "shifted") };
        CHECK(shifted.name == "shifted");
        for (int i {}; i < s.size(); ++i) {
            CHECK_THAT(shifted.axis()(i), WithinRel(s.axis()(i) + 2.0, 1e-12));
        }
        CHECK((shifted.get("radiance") == s.get("radiance")).all());
        // A shift in wavenumber space of a wavelength spectrum
        const specalg::Spectrum blue { specalg::offset(s, 100.0, "cm-1") };
        CHECK_THAT(blue.axisIn("cm-1")(0),
                   WithinRel(s.axisIn("cm-1")(0) + 100.0, 1e-12));
        CHECK(blue.axis()(0) < s.axis()(0));
    }

    SECTION("Baseline")
    {
        const specalg::Spectrum corrected { specalg::subBaseline(
          s, 2e-4, -2e-4) };
        const int last { s.size() - 1 };
        CHECK(corrected.get("radiance")(0) == s.get("radiance")(0) - 2e-4);
        CHECK(corrected.get("radiance")(last)
              == s.get("radiance")(last) + 2e-4);
        CHECK_THAT(corrected.get("radiance")(10),
                   WithinAbs(s.get("radiance")(10), 1e-15));
        // Endpoints with their own units
        const specalg::Spectrum mixed { specalg::subBaseline(
          s,
          specalg::Scalar { 0.1, "W/m2/sr/nm" },
          specalg::Scalar { 1.0, "mW/cm2/sr/nm" }) };
        CHECK_THAT(mixed.get("radiance")(0),
                   WithinRel(s.get("radiance")(0) - 0.01, 1e-12));
        CHECK_THAT(mixed.get("radiance")(last),
                   WithinRel(s.get("radiance")(last) - 1.0, 1e-12));
    }
}

TEST_CASE("resampling")
{
    const Eigen::ArrayXd axis { linearAxis(11, 400.0, 500.0) };
    const specalg::Spectrum s { makeRadiance(axis, 2.0 * axis) };
    const Eigen::ArrayXd target { linearAxis(13, 390.0, 510.0) };

    SECTION("Inside the range")
    {
        const Eigen::ArrayXd inner { linearAxis(4, 405.0, 495.0) };
        const specalg::Spectrum r { specalg::resample(s, inner, "nm") };
        for (int i {}; i < 4; ++i) {
            CHECK_THAT(r.get("radiance")(i), WithinRel(2.0 * inner(i), 1e-12));
        }
        const specalg::Spectrum cubic { specalg::resample(
          s,
          inner,
          "nm",
          specalg::OutOfBounds::nan,
          specalg::Interpolation::cubic) };
        CHECK_THAT(cubic.get("radiance")(1), WithinRel(2.0 * inner(1), 1e-10));
    }

    SECTION("Out of bounds policies")
    {
        const specalg::Spectrum nan { specalg::resample(s, target, "nm") };
        CHECK(std::isnan(nan.get("radiance")(0)));
        CHECK(std::isnan(nan.get("radiance")(12)));
        CHECK_THAT(nan.get("radiance")(1), WithinRel(800.0, 1e-12));

        const specalg::Spectrum clamp { specalg::resample(
          s, target, "nm", specalg::OutOfBounds::clamp) };
        CHECK_THAT(clamp.get("radiance")(0), WithinRel(800.0, 1e-12));
        CHECK_THAT(clamp.get("radiance")(12), WithinRel(1000.0, 1e-12));

        const specalg::Spectrum transparent { specalg::resample(
          s, target, "nm", specalg::OutOfBounds::transparent) };
        CHECK(transparent.get("radiance")(0) == 0.0);

        CHECK_THROWS_AS(specalg::resample(
                          s, target, "nm", specalg::OutOfBounds::error),
                        specalg::RangeError);
    }

    SECTION("Reciprocal target axis")
    {
        // Descending in wavenumber
        Eigen::ArrayXd wavenumbers(3);
        wavenumbers << 24000.0, 22000.0, 21000.0;
        const specalg::Spectrum r { specalg::resample(
          s, wavenumbers, "cm-1") };
        CHECK(r.axisUnit() == "cm-1");
        CHECK_THAT(r.get("radiance")(0), WithinRel(2.0 * 1e7 / 24000.0, 1e-3));
        CHECK_THAT(r.get("radiance")(2), WithinRel(2.0 * 1e7 / 21000.0, 1e-3));
    }

    SECTION("Common axis")
    {
        const specalg::Spectrum other { makeRadiance(
          linearAxis(11, 450.0, 550.0), Eigen::ArrayXd::Ones(11)) };
        const Eigen::ArrayXd intersect { specalg::commonAxis(
          { s, other }, specalg::ResampleRange::intersect) };
        CHECK(intersect.size() == 6);
        CHECK(intersect(0) == 450.0);
        const Eigen::ArrayXd full { specalg::commonAxis(
          { s, other }, specalg::ResampleRange::full) };
        CHECK(full.size() == 16);
        CHECK_THROWS_AS(specalg::commonAxis({ s, other },
                                            specalg::ResampleRange::never),
                        specalg::ValueError);
        const specalg::Spectrum far { makeRadiance(
          linearAxis(3, 600.0, 700.0), Eigen::ArrayXd::Ones(3)) };
        CHECK_THROWS_AS(specalg::commonAxis({ s, far },
                                            specalg::ResampleRange::intersect),
                        specalg::RangeError);
        // Identical axes are returned unchanged
        CHECK((specalg::commonAxis({ s, s }, specalg::ResampleRange::never)
               == axis)
                .all());
    }
}

TEST_CASE("spectrum-spectrum algebra")
{
    const Eigen::ArrayXd axis { linearAxis(11, 400.0, 500.0) };
    const specalg::Spectrum a { makeRadiance(axis, Eigen::ArrayXd::Ones(11)) };

    SECTION("Sum in different units and on different axes")
    {
        const specalg::Spectrum b { makeRadiance(linearAxis(21, 450.0, 550.0),
                                                 Eigen::ArrayXd::Ones(21),
                                                 "W/m2/sr/nm") };
        const specalg::Spectrum sum { a + b };
        CHECK(sum.unit("radiance") == "mW/cm2/sr/nm");
        CHECK(sum.axis()(0) == 450.0);
        CHECK(sum.axis()(sum.size() - 1) == 500.0);
        CHECK_THAT(sum.get("radiance")(0), WithinRel(1.1, 1e-12));
        const specalg::Spectrum full { specalg::add(
          a, b, specalg::ResampleRange::full) };
        CHECK(std::isnan(full.get("radiance")(0)));
        const specalg::Spectrum difference { a - a };
        CHECK(difference.max() == 0.0);
    }

    SECTION("Mismatching operands")
    {
        const specalg::Spectrum t { axis, "nm", "transmittance",
                                    Eigen::ArrayXd::Ones(11) };
        CHECK_THROWS_AS(a + t, specalg::ValueError);
        specalg::Spectrum both { a };
        both.setQuantity("transmittance", Eigen::ArrayXd::Ones(11), "");
        CHECK_THROWS_AS(a + both, specalg::KeyError);
        const specalg::Spectrum kelvin { axis, "nm", "radiance",
                                         Eigen::ArrayXd::Ones(11), "K" };
        CHECK_THROWS_AS(a + kelvin, specalg::UnitError);
    }

    SECTION("Results do not alias the operands")
    {
        specalg::Spectrum b { a };
        const specalg::Spectrum sum { a + b };
        b *= 10.0;
        CHECK(sum.get("radiance")(0) == 2.0);
    }
}

TEST_CASE("comparison")
{
    const Eigen::ArrayXd axis { linearAxis(11, 400.0, 500.0) };
    const specalg::Spectrum a { makeRadiance(axis, 1.0 + 0.01 * axis) };

    SECTION("Differences")
    {
        const specalg::Spectrum b { a + 0.5 };
        const specalg::Diff diff { specalg::getDiff(b, a) };
        CHECK(diff.unit == "mW/cm2/sr/nm");
        CHECK_THAT(diff.values(4), WithinAbs(0.5, 1e-12));
        const specalg::Diff ratio { specalg::getRatio(a, a) };
        CHECK(ratio.unit.empty());
        CHECK((ratio.values == 1.0).all());
        CHECK(specalg::getResidual(a, a) == 0.0);
        CHECK(specalg::getResidual(b, a) > 0.0);
    }

    SECTION("Tolerances")
    {
        const specalg::Spectrum close { a * (1.0 + 1e-7) };
        const specalg::Spectrum far { a * 1.01 };
        CHECK(close == a);
        CHECK_FALSE(far == a);
        specalg::CompareOptions loose {};
        loose.rtol = 0.05;
        CHECK(specalg::compareWith(far, a, {}, loose));
        specalg::CompareOptions integral {};
        integral.mode = specalg::CompareMode::integral;
        integral.rtol = 0.02;
        CHECK(specalg::compareWith(far, a, {}, integral));
    }

    SECTION("Quantity selection")
    {
        specalg::Spectrum both { a };
        both.setQuantity("transmittance", Eigen::ArrayXd::Ones(11), "");
        // Different sets of quantities
        CHECK_FALSE(both == a);
        CHECK(specalg::compareWith(both, a, { "radiance" }));
        CHECK_THROWS_AS(specalg::compareWith(both, a, { "transmittance" }),
                        specalg::KeyError);
    }

    SECTION("Metadata is ignored")
    {
        specalg::Spectrum renamed { a };
        renamed.name = "other";
        renamed.conditions["Tgas"] = 300.0;
        CHECK(renamed == a);
    }
}

TEST_CASE("slit function")
{
    const Eigen::ArrayXd axis { linearAxis(401, 400.0, 500.0) };
    specalg::Spectrum s { axis, "nm" };
    s.setQuantity(
      "radiance_noslit", gaussianLine(axis, 450.0, 0.3), "mW/cm2/sr/nm");
    s.setQuantity(
      "transmittance_noslit", Eigen::ArrayXd::Constant(401, 0.8), "");
    const specalg::GaussianSlit slit { 2.0, "nm" };
    const specalg::Spectrum convolved { specalg::applySlit(s, slit) };

    SECTION("Convolved counterparts")
    {
        REQUIRE(convolved.has("radiance"));
        REQUIRE(convolved.has("transmittance"));
        CHECK(convolved.has("radiance_noslit"));
        // The line is broadened but its area is preserved
        CHECK(convolved.max("radiance") < 0.5 * s.max("radiance_noslit"));
        CHECK_THAT(convolved.integral("radiance"),
                   WithinRel(s.integral("radiance_noslit"), 1e-3));
        // A constant stays constant up to the edges
        CHECK_THAT(convolved.get("transmittance")(0), WithinRel(0.8, 1e-12));
        CHECK_THAT(convolved.get("transmittance")(200), WithinRel(0.8, 1e-12));
    }

    SECTION("Slit width in wavenumber")
    {
        const specalg::GaussianSlit wide { 100.0, "cm-1" };
        const specalg::Spectrum r { specalg::applySlit(s, wide) };
        CHECK(r.max("radiance") < s.max("radiance_noslit"));
        CHECK_THROWS_AS((specalg::GaussianSlit { -1.0, "nm" }),
                        specalg::ValueError);
    }
}
