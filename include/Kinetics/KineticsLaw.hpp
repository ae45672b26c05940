#ifndef KINETICS_LAW_HPP
#define KINETICS_LAW_HPP

#include <sundials/sundials_types.h>

#include <concepts>
#include <optional>
#include <string>
#include <variant>

/// @brief Closed set of microbial rate laws
enum class KineticsType { Monod, Linear, Haldane, Contois, Teissier, Moser, ChenHashimoto, Andrews, Ierusalimsky };

// Each rate law carries only its own parameters. Laws coupled to biomass provide
// specificRate(S, B) [1/time], the linear law provides directRate(S) [mass/volume/time].
// Units: concentrations in g/L, time in days.

/** mu = mu_max * S / (K_S + S) */
struct MonodKinetics {
    static constexpr KineticsType type = KineticsType::Monod;
    realtype mu_max;
    realtype K_S;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** R = k * S, independent of biomass */
struct LinearKinetics {
    static constexpr KineticsType type = KineticsType::Linear;
    realtype k;

    realtype directRate(realtype S) const;
    void validate() const;
};

/** mu = mu_max * S / (K_S + S) * K_I / (K_I + S) */
struct HaldaneKinetics {
    static constexpr KineticsType type = KineticsType::Haldane;
    realtype mu_max;
    realtype K_S;
    realtype K_I;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** mu = mu_max * (S/B) / (K_C + S/B), density dependent */
struct ContoisKinetics {
    static constexpr KineticsType type = KineticsType::Contois;
    realtype mu_max;
    realtype K_C;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** mu = mu_max * (1 - exp(-S / K_T)) */
struct TeissierKinetics {
    static constexpr KineticsType type = KineticsType::Teissier;
    realtype mu_max;
    realtype K_T;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** mu = mu_max * S^n / (K_S + S^n) */
struct MoserKinetics {
    static constexpr KineticsType type = KineticsType::Moser;
    realtype mu_max;
    realtype K_S;
    realtype n;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** r = S / S_ref, mu = mu_max * r / (k_CH + r * (1 - r)) */
struct ChenHashimotoKinetics {
    static constexpr KineticsType type = KineticsType::ChenHashimoto;
    realtype mu_max;
    realtype S_ref;  // reference substrate concentration S0
    realtype k_CH;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** mu = mu_max * S / (K_S + S + S^2 / K_I) */
struct AndrewsKinetics {
    static constexpr KineticsType type = KineticsType::Andrews;
    realtype mu_max;
    realtype K_S;
    realtype K_I;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

/** mu = mu_max * S / (K_S + S) * K_P / (K_P + S) */
struct IerusalimskyKinetics {
    static constexpr KineticsType type = KineticsType::Ierusalimsky;
    realtype mu_max;
    realtype K_S;
    realtype K_P;

    realtype specificRate(realtype S, realtype B) const;
    void validate() const;
};

using KineticsLaw = std::variant<MonodKinetics,
                                 LinearKinetics,
                                 HaldaneKinetics,
                                 ContoisKinetics,
                                 TeissierKinetics,
                                 MoserKinetics,
                                 ChenHashimotoKinetics,
                                 AndrewsKinetics,
                                 IerusalimskyKinetics>;

// Rate law shapes: "specific rate x biomass" or a direct rate
template <typename T>
concept SpecificRateLaw = requires(const T& law, realtype S, realtype B) {
    { law.specificRate(S, B) } -> std::convertible_to<realtype>;
};

template <typename T>
concept DirectRateLaw = requires(const T& law, realtype S) {
    { law.directRate(S) } -> std::convertible_to<realtype>;
};

/// Biomass formation rate R [g/L/d]: mu(S, B) * B, or k * S for the linear law
realtype biomassFormationRate(const KineticsLaw& kinetics, realtype S, realtype B);

/// Specific rate mu [1/d]; std::nullopt for laws that are not coupled to biomass
std::optional<realtype> specificRate(const KineticsLaw& kinetics, realtype S, realtype B);

bool isBiomassCoupled(const KineticsLaw& kinetics);

KineticsType kineticsType(const KineticsLaw& kinetics);

/// Canonical lowercase name, e.g. "chen-hashimoto"
std::string kineticsName(KineticsType type);

/// Throws ConfigurationError if a parameter lies outside its formula's domain
void validate(const KineticsLaw& kinetics);

/// e.g. "monod(mu_max=0.4, K_S=20)"
std::string describe(const KineticsLaw& kinetics);

#endif  // KINETICS_LAW_HPP
