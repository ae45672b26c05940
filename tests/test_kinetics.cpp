#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Kinetics/KineticsFactory.hpp"
#include "Kinetics/KineticsLaw.hpp"

namespace {

const std::vector<KineticsType> allTypes = {KineticsType::Monod,         KineticsType::Linear,   KineticsType::Haldane,
                                            KineticsType::Contois,       KineticsType::Teissier, KineticsType::Moser,
                                            KineticsType::ChenHashimoto, KineticsType::Andrews,  KineticsType::Ierusalimsky};

}  // namespace

TEST_CASE("Rate formulas", "[kinetics]") {
    SECTION("monod") {
        const KineticsLaw law = MonodKinetics{0.4, 20.0};
        REQUIRE(specificRate(law, 20.0, 2.0).value() == Approx(0.2));
        REQUIRE(biomassFormationRate(law, 20.0, 2.0) == Approx(0.4));
    }
    SECTION("linear is a direct rate") {
        const KineticsLaw law = LinearKinetics{0.05};
        REQUIRE(biomassFormationRate(law, 100.0, 1.0) == Approx(5.0));
        // independent of biomass
        REQUIRE(biomassFormationRate(law, 100.0, 42.0) == Approx(5.0));
        REQUIRE_FALSE(specificRate(law, 100.0, 1.0).has_value());
        REQUIRE_FALSE(isBiomassCoupled(law));
    }
    SECTION("haldane") {
        const KineticsLaw law = HaldaneKinetics{0.4, 20.0, 250.0};
        REQUIRE(specificRate(law, 20.0, 1.0).value() == Approx(0.4 * 0.5 * 250.0 / 270.0));
    }
    SECTION("contois") {
        const KineticsLaw law = ContoisKinetics{0.4, 5.0};
        REQUIRE(specificRate(law, 10.0, 2.0).value() == Approx(0.2));
        REQUIRE(biomassFormationRate(law, 10.0, 2.0) == Approx(0.4));
    }
    SECTION("teissier") {
        const KineticsLaw law = TeissierKinetics{0.4, 15.0};
        REQUIRE(specificRate(law, 15.0, 1.0).value() == Approx(0.4 * (1.0 - std::exp(-1.0))));
    }
    SECTION("moser") {
        const KineticsLaw law = MoserKinetics{0.4, 20.0, 2.0};
        REQUIRE(specificRate(law, 10.0, 1.0).value() == Approx(0.4 * 100.0 / 120.0));
    }
    SECTION("chen-hashimoto") {
        const KineticsLaw law = ChenHashimotoKinetics{0.4, 100.0, 0.5};
        REQUIRE(specificRate(law, 50.0, 1.0).value() == Approx(0.4 * 0.5 / 0.75));
    }
    SECTION("andrews") {
        const KineticsLaw law = AndrewsKinetics{0.4, 20.0, 250.0};
        REQUIRE(specificRate(law, 50.0, 1.0).value() == Approx(0.25));
    }
    SECTION("ierusalimsky") {
        const KineticsLaw law = IerusalimskyKinetics{0.4, 20.0, 250.0};
        REQUIRE(specificRate(law, 20.0, 1.0).value() == Approx(0.4 * 0.5 * 250.0 / 270.0));
        REQUIRE(isBiomassCoupled(law));
    }
}

TEST_CASE("Rates are non-negative on the valid domain", "[kinetics]") {
    for (KineticsType type : allTypes) {
        const KineticsLaw law = makeKineticsLaw(type, defaultKineticParameters());
        for (realtype S : {0.0, 0.5, 20.0, 100.0}) {
            for (realtype B : {1e-6, 1.0, 30.0}) {
                INFO(describe(law) << " at S=" << S << ", B=" << B);
                REQUIRE(biomassFormationRate(law, S, B) >= 0.0);
            }
        }
    }
}

TEST_CASE("Zero maximum rate is a zero rate", "[kinetics]") {
    ParameterMap parameters = defaultKineticParameters();
    parameters["mu_max"] = 0.0;
    parameters["k"] = 0.0;
    for (KineticsType type : allTypes) {
        const KineticsLaw law = makeKineticsLaw(type, parameters);
        INFO(describe(law));
        REQUIRE(biomassFormationRate(law, 50.0, 2.0) == 0.0);
    }
}

TEST_CASE("Domain errors during evaluation", "[kinetics][errors]") {
    SECTION("contois without biomass") {
        const KineticsLaw law = ContoisKinetics{0.4, 5.0};
        REQUIRE_THROWS_AS(biomassFormationRate(law, 10.0, 0.0), DomainError);
    }
    SECTION("chen-hashimoto far above the reference concentration") {
        const KineticsLaw law = ChenHashimotoKinetics{0.4, 100.0, 0.5};
        REQUIRE_THROWS_AS(biomassFormationRate(law, 300.0, 1.0), DomainError);
    }
    SECTION("chen-hashimoto with zero reference concentration") {
        const KineticsLaw law = ChenHashimotoKinetics{0.4, 0.0, 0.5};
        REQUIRE_THROWS_AS(biomassFormationRate(law, 10.0, 1.0), DomainError);
    }
    SECTION("moser with negative substrate and fractional exponent") {
        const KineticsLaw law = MoserKinetics{0.4, 20.0, 0.5};
        REQUIRE_THROWS_AS(biomassFormationRate(law, -1.0, 1.0), DomainError);
        // integer exponents are defined for negative bases
        const KineticsLaw integer_law = MoserKinetics{0.4, 20.0, 2.0};
        REQUIRE_NOTHROW(biomassFormationRate(integer_law, -1.0, 1.0));
    }
    SECTION("teissier with zero K_T") {
        const KineticsLaw law = TeissierKinetics{0.4, 0.0};
        REQUIRE_THROWS_AS(biomassFormationRate(law, 10.0, 1.0), DomainError);
    }
}

TEST_CASE("Parameter validation", "[kinetics][errors]") {
    REQUIRE_NOTHROW(validate(KineticsLaw{MonodKinetics{0.0, 20.0}}));
    REQUIRE_THROWS_AS(validate(KineticsLaw{MonodKinetics{0.4, 0.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{MonodKinetics{-0.1, 20.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{LinearKinetics{-1.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{HaldaneKinetics{0.4, 20.0, 0.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{ContoisKinetics{0.4, -5.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{TeissierKinetics{0.4, 0.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{MoserKinetics{0.4, 20.0, 0.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{ChenHashimotoKinetics{0.4, 0.0, 0.5}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{AndrewsKinetics{0.4, 20.0, -250.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{IerusalimskyKinetics{0.4, 20.0, 0.0}}), ConfigurationError);
    REQUIRE_THROWS_AS(validate(KineticsLaw{MonodKinetics{std::numeric_limits<realtype>::quiet_NaN(), 20.0}}),
                      ConfigurationError);

    REQUIRE_THROWS_WITH(validate(KineticsLaw{MonodKinetics{0.4, 0.0}}), Catch::Matchers::Contains("monod") &&
                                                                            Catch::Matchers::Contains("K_S"));
}

TEST_CASE("Parsing kinetics names", "[kinetics][factory]") {
    REQUIRE(parseKineticsType("monod") == KineticsType::Monod);
    REQUIRE(parseKineticsType("Monod") == KineticsType::Monod);
    REQUIRE(parseKineticsType("chen-hashimoto") == KineticsType::ChenHashimoto);
    REQUIRE(parseKineticsType("Chen_Hashimoto") == KineticsType::ChenHashimoto);
    REQUIRE(parseKineticsType("IERUSALIMSKY") == KineticsType::Ierusalimsky);

    REQUIRE_THROWS_AS(parseKineticsType("unknown"), ConfigurationError);
    REQUIRE_THROWS_AS(parseKineticsType(""), ConfigurationError);
    REQUIRE_THROWS_WITH(parseKineticsType("unknown"), Catch::Matchers::Contains("unknown"));

    for (KineticsType type : allTypes) {
        REQUIRE(parseKineticsType(kineticsName(type)) == type);
    }
}

TEST_CASE("Building rate laws from parameter maps", "[kinetics][factory]") {
    SECTION("variant reads only its own parameters") {
        const KineticsLaw law = makeKineticsLaw("moser", {{"mu_max", 0.3}, {"K_S", 10.0}, {"n", 2.0}, {"K_I", -1.0}});
        REQUIRE(kineticsType(law) == KineticsType::Moser);
        const auto& moser = std::get<MoserKinetics>(law);
        REQUIRE(moser.mu_max == 0.3);
        REQUIRE(moser.K_S == 10.0);
        REQUIRE(moser.n == 2.0);
    }
    SECTION("missing parameter") {
        REQUIRE_THROWS_AS(makeKineticsLaw("haldane", {{"mu_max", 0.4}, {"K_S", 20.0}}), ConfigurationError);
        REQUIRE_THROWS_WITH(makeKineticsLaw("haldane", {{"mu_max", 0.4}, {"K_S", 20.0}}),
                            Catch::Matchers::Contains("missing required parameter K_I"));
    }
    SECTION("parameter outside the formula domain") {
        REQUIRE_THROWS_AS(makeKineticsLaw("monod", {{"mu_max", 0.4}, {"K_S", 0.0}}), ConfigurationError);
    }
    SECTION("unknown variant") {
        REQUIRE_THROWS_AS(makeKineticsLaw("unknown", defaultKineticParameters()), ConfigurationError);
    }
    SECTION("every variant builds from the defaults") {
        for (KineticsType type : allTypes) {
            const KineticsLaw law = makeKineticsLaw(type, defaultKineticParameters());
            REQUIRE(kineticsType(law) == type);
            for (const std::string& name : requiredParameters(type)) {
                REQUIRE(defaultKineticParameters().count(name) == 1);
            }
        }
    }
}

TEST_CASE("Required parameters and descriptions", "[kinetics]") {
    REQUIRE(requiredParameters(KineticsType::Linear) == std::vector<std::string>{"k"});
    REQUIRE(requiredParameters(KineticsType::Moser) == std::vector<std::string>{"mu_max", "K_S", "n"});
    REQUIRE(requiredParameters(KineticsType::ChenHashimoto) == std::vector<std::string>{"mu_max", "S0", "k_CH"});

    REQUIRE(describe(KineticsLaw{MonodKinetics{0.4, 20.0}}) == "monod(mu_max=0.4, K_S=20)");
    REQUIRE(describe(KineticsLaw{LinearKinetics{0.05}}) == "linear(k=0.05)");
    REQUIRE(describe(KineticsLaw{ChenHashimotoKinetics{0.4, 100.0, 0.5}}) == "chen-hashimoto(mu_max=0.4, S0=100, k_CH=0.5)");
}
