#ifndef SIMULATION_RUNNER_HPP
#define SIMULATION_RUNNER_HPP

#include <memory>

#include "Integrator.hpp"
#include "Reactor/SimulationConfig.hpp"
#include "Solver.hpp"
#include "Trajectory.hpp"

/**
 * @brief Entry point for external collaborators
 *
 * Binds the configured rate law and mass balance into an ODE system,
 * integrates it over [t_start, t_end] and returns the sampled trajectory.
 * Stateless apart from the integrator, which is shared read-only, so one
 * runner may serve concurrent runs. ConfigurationError, DomainError and
 * IntegrationError are rethrown with their type kept and the configuration
 * prepended to the message.
 */
class SimulationRunner {
   public:
    // SUNDIALS ERK with default SolverOptions
    SimulationRunner();
    explicit SimulationRunner(const SolverOptions& options);
    explicit SimulationRunner(std::shared_ptr<const IntegratorBase> integrator);

    Trajectory run(const SimulationConfig& config) const;

   private:
    std::shared_ptr<const IntegratorBase> integrator;
};

/// One-shot run with default solver settings
Trajectory simulate(const SimulationConfig& config);

#endif  // SIMULATION_RUNNER_HPP
