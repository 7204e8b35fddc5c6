// Unit tests for the line-of-sight composition of slabs

#include "../testing.h"

#include <common/errors.h>
#include <cmath>
#include <los/slabs.h>
#include <spectrum/compare.h>
#include <spectrum/operations.h>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("parallel composition")
{
    const Eigen::ArrayXd axis { linearAxis(21, 400.0, 500.0) };
    const specalg::Spectrum a { makeSlab(
      axis, "nm", 440.0, 5.0, 0.8, 2.0, 10.0, "a") };
    const specalg::Spectrum b { makeSlab(
      linearAxis(26, 420.0, 520.0), "nm", 460.0, 8.0, 0.3, 1.0, 20.0, "b") };
    const specalg::Spectrum c { makeSlab(
      linearAxis(41, 410.0, 490.0), "nm", 450.0, 3.0, 1.5, 0.5, 5.0, "c") };

    SECTION("Sum of radiances and product of transmittances")
    {
        const specalg::Spectrum a2 { makeSlab(
          axis, "nm", 470.0, 5.0, 0.4, 3.0, 10.0, "a2") };
        const specalg::Spectrum merged { a | a2 };
        REQUIRE(merged.size() == 21);
        for (int i {}; i < merged.size(); ++i) {
            CHECK_THAT(merged.get("radiance_noslit")(i),
                       WithinRel(a.get("radiance_noslit")(i)
                                   + a2.get("radiance_noslit")(i),
                                 1e-14));
            CHECK_THAT(merged.get("transmittance_noslit")(i),
                       WithinRel(a.get("transmittance_noslit")(i)
                                   * a2.get("transmittance_noslit")(i),
                                 1e-14));
        }
        CHECK(merged.name == "a | a2");
    }

    SECTION("Order of the slabs does not matter")
    {
        const specalg::Spectrum abc { specalg::mergeSlabs({ a, b, c }) };
        const specalg::Spectrum cab { specalg::mergeSlabs({ c, a, b }) };
        const specalg::Spectrum bca { specalg::mergeSlabs({ b, c, a }) };
        CHECK(abc == cab);
        CHECK(abc == bca);
        // Restricted to the range covered by all slabs
        CHECK(abc.axis().minCoeff() == 420.0);
        CHECK(abc.axis().maxCoeff() == 490.0);
        // Sums of linear interpolants are exact on the union of the axes
        const specalg::Spectrum nested { specalg::Spectrum { a | b } | c };
        CHECK(specalg::compareWith(nested, abc, { "radiance_noslit" }));
    }

    SECTION("Crop and merge round trip")
    {
        // The cut falls between two samples
        const specalg::Spectrum low { specalg::crop(a, {}, 452.5) };
        const specalg::Spectrum high { specalg::crop(a, 452.5, {}) };
        REQUIRE(low.size() + high.size() == a.size());
        const specalg::Spectrum merged { specalg::mergeSlabs(
          { high, low },
          specalg::ResampleRange::full,
          specalg::OutOfBounds::transparent) };
        REQUIRE(merged.size() == a.size());
        CHECK((merged.axis() == axis).all());
        CHECK(merged == a);
    }

    SECTION("Conditions")
    {
        const specalg::Spectrum merged { specalg::mergeSlabs({ a, b }) };
        CHECK(std::get<double>(merged.conditions.at("Tgas")) == 1500.0);
        // Path lengths are not summed for slabs side by side
        CHECK(std::get<std::string>(merged.conditions.at("path_length"))
              == "N/A");
        specalg::Spectrum tagged { b };
        tagged.conditions["molecule"] = std::string { "CO2" };
        const specalg::Spectrum partial { a | tagged };
        CHECK(std::get<std::string>(partial.conditions.at("molecule"))
              == "N/A");
    }

    SECTION("Slit-convolved quantities")
    {
        specalg::Spectrum with_slit { a };
        with_slit.setQuantity("radiance",
                              with_slit.get("radiance_noslit"),
                              "mW/cm2/sr/nm");
        const specalg::Spectrum merged { with_slit | b };
        CHECK_FALSE(merged.has("radiance"));
        CHECK(merged.has("radiance_noslit"));

        const specalg::Spectrum only_slit { makeRadiance(
          axis, Eigen::ArrayXd::Ones(21)) };
        CHECK_THROWS_AS(only_slit | a, specalg::ValueError);
    }

    SECTION("Invalid inputs")
    {
        CHECK_THROWS_AS(specalg::mergeSlabs({}), specalg::ValueError);
        const specalg::Spectrum unknown { axis, "nm", "brightness",
                                          Eigen::ArrayXd::Ones(21), "K" };
        CHECK_THROWS_AS(a | unknown, specalg::ValueError);
        const specalg::Spectrum emission { specalg::radianceNoslit(a) };
        const specalg::Spectrum absorption { specalg::transmittanceNoslit(b) };
        CHECK_THROWS_AS(emission | absorption, specalg::ValueError);
        const specalg::Spectrum far { makeSlab(
          linearAxis(5, 600.0, 700.0), "nm", 650.0, 5.0, 0.5, 1.0, 1.0, "f") };
        CHECK_THROWS_AS(a | far, specalg::RangeError);
        CHECK_THROWS_AS(
          specalg::mergeSlabs({ a, b }, specalg::ResampleRange::never),
          specalg::ValueError);
    }

    SECTION("Slabs in different units")
    {
        specalg::Spectrum in_si { a };
        in_si.convertUnit("radiance_noslit", "W/m2/sr/nm");
        in_si.setAxis(in_si.axisIn("um"), "um");
        const specalg::Spectrum merged { a | in_si };
        CHECK(merged.axisUnit() == "nm");
        CHECK(merged.unit("radiance_noslit") == "mW/cm2/sr/nm");
        CHECK_THAT(merged.integral("radiance_noslit"),
                   WithinRel(2.0 * a.integral("radiance_noslit"), 1e-9));
    }
}

TEST_CASE("serial composition")
{
    const Eigen::ArrayXd axis { linearAxis(21, 400.0, 500.0) };
    const specalg::Spectrum s1 { makeSlab(
      axis, "nm", 440.0, 5.0, 0.8, 2.0, 10.0, "s1") };
    const specalg::Spectrum s2 { makeSlab(
      axis, "nm", 450.0, 8.0, 0.3, 1.0, 20.0, "s2") };
    const specalg::Spectrum s3 { makeSlab(
      axis, "nm", 460.0, 3.0, 1.5, 0.5, 5.0, "s3") };

    SECTION("Radiative transfer through two slabs")
    {
        const specalg::Spectrum s12 = s1 > s2;
        REQUIRE(s12.has("radiance_noslit"));
        REQUIRE(s12.has("transmittance_noslit"));
        REQUIRE(s12.has("absorbance"));
        for (int i {}; i < s12.size(); ++i) {
            const double t1 { s1.get("transmittance_noslit")(i) };
            const double t2 { s2.get("transmittance_noslit")(i) };
            CHECK_THAT(s12.get("radiance_noslit")(i),
                       WithinRel(s1.get("radiance_noslit")(i) * t2
                                   + s2.get("radiance_noslit")(i),
                                 1e-14));
            CHECK_THAT(s12.get("transmittance_noslit")(i),
                       WithinRel(t1 * t2, 1e-14));
            CHECK_THAT(s12.get("absorbance")(i),
                       WithinAbs(-std::log(t1 * t2), 1e-12));
        }
        CHECK(s12.name == "s1 > s2");
    }

    SECTION("Order of the slabs matters")
    {
        const specalg::Spectrum forward = s1 > s2;
        const specalg::Spectrum backward = s2 > s1;
        CHECK_FALSE(
          specalg::compareWith(forward, backward, { "radiance_noslit" }));
        CHECK(
          specalg::compareWith(forward, backward, { "transmittance_noslit" }));
    }

    SECTION("Explicit grouping")
    {
        const specalg::Spectrum left { specalg::Spectrum { s1 > s2 } > s3 };
        const specalg::Spectrum right = s1 > (s2 > s3);
        const specalg::Spectrum all { specalg::serialSlabs({ s1, s2, s3 }) };
        CHECK(left == all);
        CHECK(left == right);
        CHECK(all.name == "s1 > s2 > s3");
    }

    SECTION("Chained operators are rejected")
    {
        CHECK_THROWS_AS(static_cast<void>(s1 > s2 > s3),
                        specalg::ArithmeticError);
        CHECK_THROWS_AS(static_cast<void>((s1 > s2) > (s2 > s3)),
                        specalg::ArithmeticError);
    }

    SECTION("A slab behind itself is the slab at twice the length")
    {
        const specalg::Spectrum doubled = s1 > s1;
        const specalg::Spectrum rescaled { specalg::rescalePathLength(s1,
                                                                      20.0) };
        CHECK(specalg::compareWith(
          doubled, rescaled, { "radiance_noslit", "transmittance_noslit" }));
        CHECK(std::get<double>(doubled.conditions.at("path_length")) == 20.0);
    }

    SECTION("Conditions")
    {
        const specalg::Spectrum s12 = s1 > s2;
        CHECK(std::get<double>(s12.conditions.at("path_length")) == 30.0);
        CHECK(std::get<double>(s12.conditions.at("Tgas")) == 1500.0);
        specalg::Spectrum cold { s2 };
        cold.conditions["Tgas"] = 300.0;
        const specalg::Spectrum mixed = s1 > cold;
        CHECK(std::get<std::string>(mixed.conditions.at("Tgas")) == "N/A");
    }

    SECTION("Quantities that cannot be propagated")
    {
        // Without the transmittance of the downstream slab there is no
        // radiance, but the transmittance still composes.
        const specalg::Spectrum emitter { specalg::radianceNoslit(s2) };
        CHECK_THROWS_AS(specalg::Spectrum { s1 > emitter },
                        specalg::ValueError);
        const specalg::Spectrum absorber { specalg::transmittanceNoslit(s2) };
        const specalg::Spectrum filtered = s1 > absorber;
        CHECK_FALSE(filtered.has("radiance_noslit"));
        CHECK(filtered.has("transmittance_noslit"));
        // Absorbance alone is enough to attenuate
        specalg::Spectrum by_absorbance { specalg::radianceNoslit(s2) };
        by_absorbance.setQuantity(
          "absorbance", -s2.get("transmittance_noslit").log(), "");
        const specalg::Spectrum via_a = s1 > by_absorbance;
        const specalg::Spectrum via_t = s1 > s2;
        CHECK(specalg::compareWith(via_a, via_t, { "radiance_noslit" }));
        // Coefficients are dropped along the line of sight
        specalg::Spectrum with_coeff { s2 };
        with_coeff.setQuantity("abscoeff", Eigen::ArrayXd::Ones(21), "cm-1");
        const specalg::Spectrum s12 = s1 > with_coeff;
        CHECK_FALSE(s12.has("abscoeff"));
        const specalg::Spectrum s21 = with_coeff > s1;
        CHECK_FALSE(s21.has("abscoeff"));
        CHECK(s21.has("radiance_noslit"));
    }

    SECTION("Downstream units are converted")
    {
        specalg::Spectrum in_si { s2 };
        in_si.convertUnit("radiance_noslit", "W/m2/sr/nm");
        const specalg::Spectrum converted = s1 > in_si;
        const specalg::Spectrum reference = s1 > s2;
        CHECK(converted.unit("radiance_noslit") == "mW/cm2/sr/nm");
        CHECK(converted == reference);
    }

    SECTION("Invalid inputs")
    {
        CHECK_THROWS_AS(specalg::serialSlabs({}), specalg::ValueError);
        const specalg::Spectrum only_slit { makeRadiance(
          axis, Eigen::ArrayXd::Ones(21)) };
        CHECK_THROWS_AS(specalg::serialSlabs({ s1, only_slit }),
                        specalg::ValueError);
        const specalg::Spectrum single { specalg::serialSlabs({ s1 }) };
        CHECK(single == s1);
    }
}

TEST_CASE("path length rescaling")
{
    const Eigen::ArrayXd axis { linearAxis(21, 400.0, 500.0) };
    const specalg::Spectrum s { makeSlab(
      axis, "nm", 450.0, 5.0, 0.8, 2.0, 10.0, "s") };

    SECTION("Beer-Lambert")
    {
        const specalg::Spectrum half { specalg::rescalePathLength(s, 5.0) };
        for (int i {}; i < s.size(); ++i) {
            CHECK_THAT(half.get("transmittance_noslit")(i),
                       WithinRel(std::sqrt(s.get("transmittance_noslit")(i)),
                                 1e-12));
        }
        CHECK(std::get<double>(half.conditions.at("path_length")) == 5.0);
        // Rescaling back is the identity
        CHECK(specalg::rescalePathLength(half, 10.0) == s);
        // In-place variant
        specalg::Spectrum t { s };
        t.rescalePathLength(5.0);
        CHECK(t == half);
    }

    SECTION("Preconditions")
    {
        specalg::Spectrum unknown_length { s };
        unknown_length.conditions.erase("path_length");
        CHECK_THROWS_AS(specalg::rescalePathLength(unknown_length, 1.0),
                        specalg::ValueError);
        CHECK_THROWS_AS(specalg::rescalePathLength(s, -1.0),
                        specalg::ValueError);
        const specalg::Spectrum emission_only { specalg::radianceNoslit(s) };
        CHECK_THROWS_AS(specalg::rescalePathLength(emission_only, 1.0),
                        specalg::ValueError);
    }
}
