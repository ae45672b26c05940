#ifndef MASS_BALANCE_HPP
#define MASS_BALANCE_HPP

#include <sundials/sundials_types.h>

#include <optional>
#include <string>

#include "Reactor/StateVector.hpp"

/**
 * @brief Biomass and gas yield on consumed substrate
 *
 * Y_g defaults to 1 - Y_b: every gram of substrate taken up ends either in
 * biomass or in biogas. An explicit Y_g below 1 - Y_b leaves the remainder
 * as unaccounted products.
 */
struct YieldCoefficients {
    realtype Y_b;
    std::optional<realtype> Y_g = std::nullopt;

    realtype biomassYield() const { return Y_b; }
    realtype gasYield() const { return Y_g.value_or(1.0 - Y_b); }

    // 0 < Y_b <= 1 and 0 <= Y_g <= 1 - Y_b, otherwise ConfigurationError
    void validate() const;

    std::string describe() const;
};

/**
 * @brief Split-yield mass balance
 *
 * Substrate uptake R_sub = R / Y_b feeds biomass growth R and gas production
 * Y_g * R_sub:
 *     dS/dt = -R_sub,  dB/dt = R,  dG/dt = Y_g * R_sub
 * Conserved along every trajectory: S + B + G + (1 - Y_b - Y_g) / Y_b * B
 */
class MassBalance {
   public:
    explicit MassBalance(const YieldCoefficients& yields);

    // Derivatives (dS/dt, dB/dt, dG/dt) for biomass formation rate R
    StateVector derivatives(realtype R) const;

    realtype substrateUptake(realtype R) const { return R / Y_b; }

    // Fraction of consumed substrate that ends neither in biomass nor in gas
    realtype unaccountedFraction() const { return 1.0 - Y_b - Y_g; }

    realtype conservedQuantity(const StateVector& state) const;

    realtype biomassYield() const { return Y_b; }
    realtype gasYield() const { return Y_g; }

   private:
    const realtype Y_b;
    const realtype Y_g;
};

#endif  // MASS_BALANCE_HPP
