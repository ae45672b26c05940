/**
 * @file bindings.cpp
 * @brief Python bindings for the ADSim library using nanobind
 *
 * This file provides Python bindings for the batch digestion core:
 * - Kinetics: KineticsType, parameter parsing and defaults
 * - Reactor: StateVector, YieldCoefficients, SimulationConfig
 * - Solver options and the simulate() entry point returning numpy arrays
 * - ConfigurationError, DomainError and IntegrationError as Python exceptions
 */

#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

#include <string>

#include "EigenDataTypes.hpp"
#include "Errors.hpp"
#include "Kinetics/KineticsFactory.hpp"
#include "Kinetics/KineticsLaw.hpp"
#include "Reactor/MassBalance.hpp"
#include "Reactor/SimulationConfig.hpp"
#include "Reactor/StateVector.hpp"
#include "SimulationRunner.hpp"
#include "Solver.hpp"
#include "Trajectory.hpp"

namespace nb = nanobind;
using namespace nb::literals;

namespace {

nb::dict trajectoryToDict(const Trajectory& trajectory) {
    nb::dict result;
    result["t"] = nb::cast(trajectory.t, nb::rv_policy::copy);
    result["S"] = nb::cast(trajectory.S, nb::rv_policy::copy);
    result["B"] = nb::cast(trajectory.B, nb::rv_policy::copy);
    result["G"] = nb::cast(trajectory.G, nb::rv_policy::copy);
    return result;
}

}  // namespace

NB_MODULE(adsim, m) {
    m.doc() = "ADSim - batch anaerobic digestion kinetics and integration core";

    // ==================== Exceptions ====================

    nb::exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    nb::exception<DomainError>(m, "DomainError", PyExc_ArithmeticError);
    nb::exception<IntegrationError>(m, "IntegrationError", PyExc_RuntimeError);

    // ==================== Enums ====================

    nb::enum_<KineticsType>(m, "KineticsType")
        .value("Monod", KineticsType::Monod)
        .value("Linear", KineticsType::Linear)
        .value("Haldane", KineticsType::Haldane)
        .value("Contois", KineticsType::Contois)
        .value("Teissier", KineticsType::Teissier)
        .value("Moser", KineticsType::Moser)
        .value("ChenHashimoto", KineticsType::ChenHashimoto)
        .value("Andrews", KineticsType::Andrews)
        .value("Ierusalimsky", KineticsType::Ierusalimsky);

    nb::enum_<SolverType>(m, "SolverType")
        .value("ERK", SolverType::ERK)
        .value("BDF", SolverType::BDF);

    // ==================== SolverOptions ====================

    nb::class_<SolverOptions>(m, "SolverOptions")
        .def(nb::init<>())
        .def_rw("solver_type", &SolverOptions::solverType)
        .def_rw("reltol", &SolverOptions::reltol)
        .def_rw("abstol", &SolverOptions::abstol)
        .def_rw("min_step", &SolverOptions::min_step)
        .def_rw("max_step", &SolverOptions::max_step)
        .def_rw("init_step", &SolverOptions::init_step)
        .def_rw("max_steps", &SolverOptions::max_steps)
        .def_rw("max_err_test_fails", &SolverOptions::max_err_test_fails)
        .def_rw("max_order_bdf", &SolverOptions::max_order_bdf)
        .def_rw("use_non_negative_constraint", &SolverOptions::use_sundials_non_negative_constraint)
        .def_rw("timeout_seconds", &SolverOptions::timeout_seconds);

    // ==================== Reactor ====================

    nb::class_<StateVector>(m, "StateVector")
        .def(nb::init<>())
        .def("__init__", [](StateVector& self, realtype S, realtype B, realtype G) {
            new (&self) StateVector{S, B, G};
        }, "S"_a, "B"_a, "G"_a = 0.0)
        .def_rw("S", &StateVector::S)
        .def_rw("B", &StateVector::B)
        .def_rw("G", &StateVector::G)
        .def("__repr__", [](const StateVector& s) {
            return "<StateVector S=" + std::to_string(s.S) + " B=" + std::to_string(s.B) +
                   " G=" + std::to_string(s.G) + ">";
        });

    nb::class_<YieldCoefficients>(m, "YieldCoefficients")
        .def("__init__", [](YieldCoefficients& self, realtype Y_b, std::optional<realtype> Y_g) {
            new (&self) YieldCoefficients{Y_b, Y_g};
        }, "Y_b"_a, "Y_g"_a = nb::none())
        .def_rw("Y_b", &YieldCoefficients::Y_b)
        .def_rw("Y_g", &YieldCoefficients::Y_g)
        .def("gas_yield", &YieldCoefficients::gasYield)
        .def("__repr__", [](const YieldCoefficients& y) { return "<YieldCoefficients " + y.describe() + ">"; });

    nb::class_<SimulationConfig>(m, "SimulationConfig")
        .def("__init__", [](SimulationConfig& self, const std::string& kinetics, const ParameterMap& parameters,
                            const YieldCoefficients& yields, const StateVector& initial_state, realtype t_start,
                            realtype t_end, std::size_t n_samples) {
            new (&self) SimulationConfig(
                makeSimulationConfig(kinetics, parameters, yields, initial_state, t_start, t_end, n_samples));
        }, "kinetics"_a, "parameters"_a, "yields"_a, "initial_state"_a, "t_start"_a = 0.0, "t_end"_a = 50.0,
             "n_samples"_a = 300)
        .def_prop_ro("kinetics_type", [](const SimulationConfig& c) { return kineticsType(c.kinetics); })
        .def_ro("yields", &SimulationConfig::yields)
        .def_ro("initial_state", &SimulationConfig::initialState)
        .def_ro("t_start", &SimulationConfig::t_start)
        .def_ro("t_end", &SimulationConfig::t_end)
        .def_ro("n_samples", &SimulationConfig::n_samples)
        .def("describe", &SimulationConfig::describe)
        .def("__repr__", [](const SimulationConfig& c) { return "<SimulationConfig " + c.describe() + ">"; });

    // ==================== Kinetics ====================

    m.def("parse_kinetics_type", &parseKineticsType, "name"_a);
    m.def("required_parameters", [](const std::string& name) { return requiredParameters(parseKineticsType(name)); },
          "kinetics"_a, "Parameter names read by the given kinetics variant");
    m.def("default_parameters", []() { return defaultKineticParameters(); },
          "Default kinetic parameters of all variants");
    m.def("biomass_formation_rate", [](const std::string& name, const ParameterMap& parameters, realtype S,
                                       realtype B) {
        return biomassFormationRate(makeKineticsLaw(name, parameters), S, B);
    }, "kinetics"_a, "parameters"_a, "S"_a, "B"_a);

    // ==================== Simulation ====================

    m.def("default_config", [](const std::string& kinetics) {
        return defaultSimulationConfig(parseKineticsType(kinetics));
    }, "kinetics"_a);

    m.def("run", [](const SimulationConfig& config, const SolverOptions& options) {
        Trajectory trajectory;
        {
            nb::gil_scoped_release release;
            trajectory = SimulationRunner(options).run(config);
        }
        return trajectoryToDict(trajectory);
    }, "config"_a, "options"_a = SolverOptions(), "Run a configuration; returns a dict of numpy arrays t, S, B, G");

    // Keyword form used by the presentation layer: simulate("monod", mu_max=0.4, K_S=20, ...)
    m.def("simulate", [](const std::string& kinetics, realtype Y_b, realtype S0, realtype B0, realtype t_end,
                         std::size_t n_samples, std::optional<realtype> Y_g, nb::kwargs kwargs) {
        ParameterMap parameters;
        for (auto [key, value] : kwargs) {
            parameters[nb::cast<std::string>(key)] = nb::cast<realtype>(value);
        }
        SimulationConfig config = makeSimulationConfig(kinetics, parameters, YieldCoefficients{Y_b, Y_g},
                                                       StateVector{S0, B0, 0.0}, 0.0, t_end, n_samples);
        Trajectory trajectory;
        {
            nb::gil_scoped_release release;
            trajectory = simulate(config);
        }
        return trajectoryToDict(trajectory);
    }, "kinetics"_a, "Y_b"_a = 0.3, "S0"_a = 100.0, "B0"_a = 1.0, "t_end"_a = 50.0, "n_samples"_a = 300,
          "Y_g"_a = nb::none(), "kwargs"_a);
}
