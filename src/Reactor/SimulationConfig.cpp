#include "Reactor/SimulationConfig.hpp"

#include <cmath>
#include <sstream>

#include "Errors.hpp"
#include "Logger.hpp"

namespace {

void validateInitialState(const StateVector& state) {
    std::ostringstream oss;
    if (!std::isfinite(state.S) || state.S < 0.0) {
        oss << "Initial substrate S0 must be finite and >= 0 (got " << state.S << ")";
    } else if (!std::isfinite(state.B) || state.B <= 0.0) {
        oss << "Initial biomass B0 must be finite and > 0 (got " << state.B << ")";
    } else if (!std::isfinite(state.G) || state.G < 0.0) {
        oss << "Initial biogas G0 must be finite and >= 0 (got " << state.G << ")";
    } else {
        return;
    }
    throw ConfigurationError(oss.str());
}

void validateTimeGrid(realtype t_start, realtype t_end, std::size_t n_samples) {
    if (!std::isfinite(t_start) || !std::isfinite(t_end) || t_end <= t_start) {
        std::ostringstream oss;
        oss << "Time span must be finite with t_start < t_end (got [" << t_start << ", " << t_end << "])";
        throw ConfigurationError(oss.str());
    }
    if (n_samples < 2) {
        throw ConfigurationError("Number of output samples must be >= 2 (got " + std::to_string(n_samples) + ")");
    }
}

}  // namespace

SimulationConfig::SimulationConfig(const KineticsLaw& kinetics,
                                   const YieldCoefficients& yields,
                                   const StateVector& initialState,
                                   realtype t_start,
                                   realtype t_end,
                                   std::size_t n_samples)
    : kinetics(kinetics),
      yields(yields),
      initialState(initialState),
      t_start(t_start),
      t_end(t_end),
      n_samples(n_samples) {
    validate(kinetics);
    yields.validate();
    validateInitialState(initialState);
    validateTimeGrid(t_start, t_end, n_samples);
}

std::string SimulationConfig::describe() const {
    std::ostringstream oss;
    oss << ::describe(kinetics) << ", " << yields.describe() << ", S0=" << initialState.S << ", B0=" << initialState.B
        << ", G0=" << initialState.G << ", t=[" << t_start << ", " << t_end << "], N=" << n_samples;
    return oss.str();
}

SimulationConfig makeSimulationConfig(const std::string& kinetics,
                                      const ParameterMap& kineticParameters,
                                      const YieldCoefficients& yields,
                                      const StateVector& initialState,
                                      realtype t_start,
                                      realtype t_end,
                                      std::size_t n_samples) {
    return SimulationConfig(makeKineticsLaw(kinetics, kineticParameters), yields, initialState, t_start, t_end,
                            n_samples);
}

SimulationConfig defaultSimulationConfig(KineticsType type) {
    SimulationConfig config(makeKineticsLaw(type, defaultKineticParameters()), YieldCoefficients{0.3},
                            StateVector{100.0, 1.0, 0.0}, 0.0, 50.0, 300);
    LOG("simulation_config.log", "Default configuration: " << config.describe() << "\n");
    return config;
}
