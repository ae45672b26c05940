#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <sundials/sundials_types.h>

#include <cstddef>
#include <string>

#include "Kinetics/KineticsFactory.hpp"
#include "Kinetics/KineticsLaw.hpp"
#include "Reactor/MassBalance.hpp"
#include "Reactor/StateVector.hpp"

/**
 * @brief Immutable description of one batch digestion run
 *
 * Validated on construction (ConfigurationError): kinetics parameters within
 * their formula domain, yields in range, S0 >= 0, B0 > 0, G0 >= 0, finite
 * t_start < t_end and at least two output samples.
 */
class SimulationConfig {
   public:
    SimulationConfig(const KineticsLaw& kinetics,
                     const YieldCoefficients& yields,
                     const StateVector& initialState,
                     realtype t_start,
                     realtype t_end,
                     std::size_t n_samples);

    // e.g. "monod(mu_max=0.4, K_S=20), Y_b=0.3, Y_g=0.7 (1 - Y_b), S0=100, B0=1, G0=0, t=[0, 50], N=300"
    std::string describe() const;

    const KineticsLaw kinetics;
    const YieldCoefficients yields;
    const StateVector initialState;
    const realtype t_start;
    const realtype t_end;
    const std::size_t n_samples;
};

/// Build a configuration from the values a presentation layer collects
SimulationConfig makeSimulationConfig(const std::string& kinetics,
                                      const ParameterMap& kineticParameters,
                                      const YieldCoefficients& yields,
                                      const StateVector& initialState,
                                      realtype t_start,
                                      realtype t_end,
                                      std::size_t n_samples);

/// Default scenario of the interactive application: S0=100 g/L, B0=1 g/L, 50 days, 300 samples, Y_b=0.3
SimulationConfig defaultSimulationConfig(KineticsType type);

#endif  // SIMULATION_CONFIG_HPP
