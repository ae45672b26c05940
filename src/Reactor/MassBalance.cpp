#include "Reactor/MassBalance.hpp"

#include <cmath>
#include <sstream>

#include "Errors.hpp"

namespace {
// Y_b + Y_g may exceed 1 by rounding when Y_g was computed as 1 - Y_b elsewhere
constexpr realtype yield_sum_tolerance = 1e-12;
}  // namespace

void YieldCoefficients::validate() const {
    if (!std::isfinite(Y_b) || Y_b <= 0.0 || Y_b > 1.0) {
        std::ostringstream oss;
        oss << "Biomass yield Y_b must lie in (0, 1] (got " << Y_b << ")";
        throw ConfigurationError(oss.str());
    }
    if (Y_g.has_value()) {
        const realtype y_g = Y_g.value();
        if (!std::isfinite(y_g) || y_g < 0.0) {
            std::ostringstream oss;
            oss << "Gas yield Y_g must be >= 0 (got " << y_g << ")";
            throw ConfigurationError(oss.str());
        }
        if (Y_b + y_g > 1.0 + yield_sum_tolerance) {
            std::ostringstream oss;
            oss << "Yields Y_b + Y_g must not exceed 1 (got Y_b=" << Y_b << ", Y_g=" << y_g << ")";
            throw ConfigurationError(oss.str());
        }
    }
}

std::string YieldCoefficients::describe() const {
    std::ostringstream oss;
    oss << "Y_b=" << Y_b << ", Y_g=" << gasYield();
    if (!Y_g.has_value()) oss << " (1 - Y_b)";
    return oss.str();
}

MassBalance::MassBalance(const YieldCoefficients& yields) : Y_b(yields.biomassYield()), Y_g(yields.gasYield()) {
    yields.validate();
}

StateVector MassBalance::derivatives(realtype R) const {
    const realtype R_sub = substrateUptake(R);
    return StateVector{-R_sub, R, Y_g * R_sub};
}

realtype MassBalance::conservedQuantity(const StateVector& state) const {
    return state.S + state.B + state.G + unaccountedFraction() / Y_b * state.B;
}
