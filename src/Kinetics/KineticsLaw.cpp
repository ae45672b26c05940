#include "Kinetics/KineticsLaw.hpp"

#include <sundials/sundials_types.h>

#include <cmath>
#include <sstream>
#include <string>
#include <type_traits>

#include "Errors.hpp"

namespace {

void requireFinite(KineticsType type, const char* name, realtype value) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": parameter " << name << " must be finite (got " << value << ")";
        throw ConfigurationError(oss.str());
    }
}

void requirePositive(KineticsType type, const char* name, realtype value) {
    requireFinite(type, name, value);
    if (value <= 0.0) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": parameter " << name << " must be > 0 (got " << value << ")";
        throw ConfigurationError(oss.str());
    }
}

void requireNonNegative(KineticsType type, const char* name, realtype value) {
    requireFinite(type, name, value);
    if (value < 0.0) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": parameter " << name << " must be >= 0 (got " << value << ")";
        throw ConfigurationError(oss.str());
    }
}

realtype divide(KineticsType type, realtype numerator, realtype denominator, const char* what) {
    if (denominator == 0.0) {
        throw DomainError(kineticsName(type) + ": division by zero in " + what);
    }
    return numerator / denominator;
}

// S / (K + S), the saturation factor shared by most laws
realtype saturation(KineticsType type, realtype S, realtype K) { return divide(type, S, K + S, "K + S"); }

}  // namespace

realtype MonodKinetics::specificRate(realtype S, realtype /*B*/) const { return mu_max * saturation(type, S, K_S); }

void MonodKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_S", K_S);
}

realtype LinearKinetics::directRate(realtype S) const { return k * S; }

void LinearKinetics::validate() const { requireNonNegative(type, "k", k); }

realtype HaldaneKinetics::specificRate(realtype S, realtype /*B*/) const {
    return mu_max * saturation(type, S, K_S) * divide(type, K_I, K_I + S, "K_I + S");
}

void HaldaneKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_S", K_S);
    requirePositive(type, "K_I", K_I);
}

realtype ContoisKinetics::specificRate(realtype S, realtype B) const {
    if (B <= 0.0) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": biomass must be > 0 to form S/B (got B=" << B << ")";
        throw DomainError(oss.str());
    }
    const realtype ratio = S / B;
    return mu_max * divide(type, ratio, K_C + ratio, "K_C + S/B");
}

void ContoisKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_C", K_C);
}

realtype TeissierKinetics::specificRate(realtype S, realtype /*B*/) const {
    return mu_max * (1.0 - std::exp(-divide(type, S, K_T, "S / K_T")));
}

void TeissierKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_T", K_T);
}

realtype MoserKinetics::specificRate(realtype S, realtype /*B*/) const {
    if (S < 0.0 && n != std::floor(n)) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": negative substrate S=" << S << " raised to non-integer exponent n=" << n;
        throw DomainError(oss.str());
    }
    const realtype S_n = std::pow(S, n);
    return mu_max * divide(type, S_n, K_S + S_n, "K_S + S^n");
}

void MoserKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_S", K_S);
    requirePositive(type, "n", n);
}

realtype ChenHashimotoKinetics::specificRate(realtype S, realtype /*B*/) const {
    const realtype r = divide(type, S, S_ref, "S / S0");
    const realtype denominator = k_CH + r * (1.0 - r);
    // S far above S_ref drives the denominator through zero
    if (denominator <= 0.0) {
        std::ostringstream oss;
        oss << kineticsName(type) << ": non-positive denominator k_CH + r(1-r) = " << denominator << " at S/S0=" << r;
        throw DomainError(oss.str());
    }
    return mu_max * r / denominator;
}

void ChenHashimotoKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "S0", S_ref);
    requirePositive(type, "k_CH", k_CH);
}

realtype AndrewsKinetics::specificRate(realtype S, realtype /*B*/) const {
    return mu_max * divide(type, S, K_S + S + divide(type, S * S, K_I, "S^2 / K_I"), "K_S + S + S^2/K_I");
}

void AndrewsKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_S", K_S);
    requirePositive(type, "K_I", K_I);
}

realtype IerusalimskyKinetics::specificRate(realtype S, realtype /*B*/) const {
    return mu_max * saturation(type, S, K_S) * divide(type, K_P, K_P + S, "K_P + S");
}

void IerusalimskyKinetics::validate() const {
    requireNonNegative(type, "mu_max", mu_max);
    requirePositive(type, "K_S", K_S);
    requirePositive(type, "K_P", K_P);
}

realtype biomassFormationRate(const KineticsLaw& kinetics, realtype S, realtype B) {
    return std::visit(
        [S, B](const auto& law) -> realtype {
            using Law = std::decay_t<decltype(law)>;
            if constexpr (SpecificRateLaw<Law>) {
                return law.specificRate(S, B) * B;
            } else {
                static_assert(DirectRateLaw<Law>, "Rate law must provide specificRate(S, B) or directRate(S)");
                return law.directRate(S);
            }
        },
        kinetics);
}

std::optional<realtype> specificRate(const KineticsLaw& kinetics, realtype S, realtype B) {
    return std::visit(
        [S, B](const auto& law) -> std::optional<realtype> {
            if constexpr (SpecificRateLaw<std::decay_t<decltype(law)>>) {
                return law.specificRate(S, B);
            } else {
                return std::nullopt;
            }
        },
        kinetics);
}

bool isBiomassCoupled(const KineticsLaw& kinetics) {
    return std::visit([](const auto& law) { return SpecificRateLaw<std::decay_t<decltype(law)>>; }, kinetics);
}

KineticsType kineticsType(const KineticsLaw& kinetics) {
    return std::visit([](const auto& law) { return std::decay_t<decltype(law)>::type; }, kinetics);
}

std::string kineticsName(KineticsType type) {
    switch (type) {
        case KineticsType::Monod:
            return "monod";
        case KineticsType::Linear:
            return "linear";
        case KineticsType::Haldane:
            return "haldane";
        case KineticsType::Contois:
            return "contois";
        case KineticsType::Teissier:
            return "teissier";
        case KineticsType::Moser:
            return "moser";
        case KineticsType::ChenHashimoto:
            return "chen-hashimoto";
        case KineticsType::Andrews:
            return "andrews";
        case KineticsType::Ierusalimsky:
            return "ierusalimsky";
    }
    throw ConfigurationError("Unknown kinetics type " + std::to_string(static_cast<int>(type)));
}

void validate(const KineticsLaw& kinetics) {
    std::visit([](const auto& law) { law.validate(); }, kinetics);
}

std::string describe(const KineticsLaw& kinetics) {
    std::ostringstream oss;
    oss << kineticsName(kineticsType(kinetics)) << "(";
    std::visit(
        [&oss](const auto& law) {
            using Law = std::decay_t<decltype(law)>;
            if constexpr (std::is_same_v<Law, MonodKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_S=" << law.K_S;
            } else if constexpr (std::is_same_v<Law, LinearKinetics>) {
                oss << "k=" << law.k;
            } else if constexpr (std::is_same_v<Law, HaldaneKinetics> || std::is_same_v<Law, AndrewsKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_S=" << law.K_S << ", K_I=" << law.K_I;
            } else if constexpr (std::is_same_v<Law, ContoisKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_C=" << law.K_C;
            } else if constexpr (std::is_same_v<Law, TeissierKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_T=" << law.K_T;
            } else if constexpr (std::is_same_v<Law, MoserKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_S=" << law.K_S << ", n=" << law.n;
            } else if constexpr (std::is_same_v<Law, ChenHashimotoKinetics>) {
                oss << "mu_max=" << law.mu_max << ", S0=" << law.S_ref << ", k_CH=" << law.k_CH;
            } else if constexpr (std::is_same_v<Law, IerusalimskyKinetics>) {
                oss << "mu_max=" << law.mu_max << ", K_S=" << law.K_S << ", K_P=" << law.K_P;
            }
        },
        kinetics);
    oss << ")";
    return oss.str();
}
