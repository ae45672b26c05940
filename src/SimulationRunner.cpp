#include "SimulationRunner.hpp"

#include <string>
#include <utility>

#include "Errors.hpp"
#include "Logger.hpp"
#include "Observers/TimeSeriesObserver.hpp"
#include "Reactor/DigesterModel.hpp"
#include "Reactor/StateVector.hpp"

SimulationRunner::SimulationRunner() : SimulationRunner(SolverOptions()) {}

SimulationRunner::SimulationRunner(const SolverOptions& options)
    : integrator(std::make_shared<SundialsIntegrator>(options)) {}

SimulationRunner::SimulationRunner(std::shared_ptr<const IntegratorBase> integrator)
    : integrator(std::move(integrator)) {
    if (!this->integrator) {
        throw ConfigurationError("SimulationRunner requires an integrator");
    }
}

Trajectory SimulationRunner::run(const SimulationConfig& config) const {
    const std::string description = config.describe();
    LOG("simulation_runner.log", "Run: " << description << "\n");

    try {
        const OdeRhs rhs = digesterModel_rhs(config.kinetics, config.yields);
        TimeSeriesObserver observer(config.t_start, config.t_end, config.n_samples, StateVector::SIZE);

        integrator->integrate(rhs, config.initialState.toVector(), observer);

        Trajectory trajectory = Trajectory::fromObserver(observer);
        LOG("simulation_runner.log", "Finished: S=" << trajectory.S(trajectory.S.size() - 1)
                                                    << ", B=" << trajectory.B(trajectory.B.size() - 1)
                                                    << ", G=" << trajectory.G(trajectory.G.size() - 1) << " at t="
                                                    << trajectory.t(trajectory.t.size() - 1) << "\n");
        return trajectory;
    } catch (const ConfigurationError& e) {
        LOG("simulation_runner.log", "ConfigurationError: " << e.what() << "\n");
        throw ConfigurationError(description + ": " + e.what());
    } catch (const DomainError& e) {
        LOG("simulation_runner.log", "DomainError: " << e.what() << "\n");
        throw DomainError(description + ": " + e.what());
    } catch (const IntegrationError& e) {
        LOG("simulation_runner.log", "IntegrationError: " << e.what() << "\n");
        throw IntegrationError(description + ": " + e.what());
    }
}

Trajectory simulate(const SimulationConfig& config) { return SimulationRunner().run(config); }
