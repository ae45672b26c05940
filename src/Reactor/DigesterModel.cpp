#include "Reactor/DigesterModel.hpp"

#include <sundials/sundials_types.h>

#include <sstream>

#include "Logger.hpp"
#include "Reactor/StateVector.hpp"

OdeRhs digesterModel_rhs(const KineticsLaw& kinetics, const YieldCoefficients& yields) {
    return [kinetics, massBalance = MassBalance(yields), call_count = 0](realtype t, const ConstVectorMap& y,
                                                                         VectorMap& dy_dt) mutable {
        const realtype S = y(StateVector::S_IDX);
        const realtype B = y(StateVector::B_IDX);

        const realtype R = biomassFormationRate(kinetics, S, B);
        const StateVector d = massBalance.derivatives(R);

        dy_dt(StateVector::S_IDX) = d.S;
        dy_dt(StateVector::B_IDX) = d.B;
        dy_dt(StateVector::G_IDX) = d.G;

#if LOG_ENABLED
        ++call_count;
        if (call_count < LOG_FIRST_N_CALLS || call_count % LOG_EVERY_N_CALLS == 0) {
            std::ostringstream oss;
            oss.precision(6);
            oss << std::scientific;
            oss << "Digester rhs call " << call_count << " at t = " << t << " d\n";
            oss << "State [S, B, G]: " << y.transpose() << "\n";
            oss << "Biomass formation rate R = " << R << ", substrate uptake R_sub = " << massBalance.substrateUptake(R)
                << "\n";
            oss << "Derivatives: " << dy_dt.transpose() << "\n\n";
            LOG("digester_rhs.log", oss.str());
        }
#endif
    };
}
