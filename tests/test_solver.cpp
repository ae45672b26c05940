#include <catch2/catch.hpp>

#include <cmath>
#include <vector>

#include "EigenDataTypes.hpp"
#include "Errors.hpp"
#include "Observers/TimeSeriesObserver.hpp"
#include "Solver.hpp"

namespace {

// y' = lambda * y
OdeRhs exponential(realtype lambda) {
    return [lambda](realtype /*t*/, const ConstVectorMap& y, VectorMap& dy_dt) { dy_dt = lambda * y; };
}

Vector scalar(realtype value) {
    Vector y(1);
    y << value;
    return y;
}

}  // namespace

TEST_CASE("Exponential growth against the analytic solution", "[solver]") {
    const OdeRhs rhs = exponential(0.5);
    Solver solver(rhs, scalar(1.0), 0.0, 4.0);
    TimeSeriesObserver observer(0.0, 4.0, 41, 1);
    solver.solve(observer);

    REQUIRE(observer.complete());
    for (std::size_t i = 0; i < observer.n_samples(); ++i) {
        const realtype t = observer.t_desired(i);
        INFO("t = " << t);
        REQUIRE(observer.getSamples()(static_cast<Eigen::Index>(i), 0) == Approx(std::exp(0.5 * t)).epsilon(1e-4));
    }
    REQUIRE(solver.getT() == 4.0);
    REQUIRE(solver.getY()[0] == Approx(std::exp(2.0)).epsilon(1e-4));
}

TEST_CASE("Endpoints of the output grid", "[solver]") {
    const OdeRhs rhs = exponential(-1.0);
    Solver solver(rhs, scalar(3.0), 1.0, 2.0);
    TimeSeriesObserver observer(1.0, 2.0, 5, 1);
    solver.solve(observer);

    // initial state is passed through untouched
    REQUIRE(observer.getSamples()(0, 0) == 3.0);
    REQUIRE(observer.getTimes()(0) == 1.0);
    REQUIRE(observer.getTimes()(4) == 2.0);
    REQUIRE(observer.getSamples()(4, 0) == Approx(3.0 * std::exp(-1.0)).epsilon(1e-4));
}

TEST_CASE("Sample count does not change the steps taken", "[solver]") {
    const OdeRhs rhs = exponential(-0.3);

    Solver coarse(rhs, scalar(2.0), 0.0, 10.0);
    TimeSeriesObserver coarse_observer(0.0, 10.0, 3, 1);
    coarse.solve(coarse_observer);

    Solver fine(rhs, scalar(2.0), 0.0, 10.0);
    TimeSeriesObserver fine_observer(0.0, 10.0, 301, 1);
    fine.solve(fine_observer);

    REQUIRE(coarse.getInternalTimeStamps() == fine.getInternalTimeStamps());
    REQUIRE(coarse.getStatistics().n_steps == fine.getStatistics().n_steps);
    REQUIRE(coarse.getY()[0] == fine.getY()[0]);

    // t = 5 is a sample of both grids
    REQUIRE(coarse_observer.getSamples()(1, 0) == Approx(fine_observer.getSamples()(150, 0)).epsilon(1e-8));
    REQUIRE(coarse_observer.getSamples()(1, 0) == Approx(2.0 * std::exp(-1.5)).epsilon(1e-4));
}

TEST_CASE("Statistics of a run", "[solver]") {
    const OdeRhs rhs = exponential(-1.0);
    Solver solver(rhs, scalar(1.0), 0.0, 5.0);
    TimeSeriesObserver observer(0.0, 5.0, 11, 1);
    solver.solve(observer);

    const SolverStatistics stats = solver.getStatistics();
    REQUIRE(stats.n_steps > 0);
    REQUIRE(stats.n_rhs_evals >= stats.n_steps);
    REQUIRE(solver.getInternalTimeStamps().size() == static_cast<std::size_t>(stats.n_steps) + 1);
    REQUIRE(solver.getInternalTimeStamps().front() == 0.0);
    REQUIRE(solver.getInternalTimeStamps().back() == 5.0);
    REQUIRE(solver.getSolveTime() >= 0.0);
}

TEST_CASE("Finite-time blow-up raises IntegrationError", "[solver][errors]") {
    // y' = y^2, y(0) = 1 has the solution 1 / (1 - t), singular at t = 1
    const OdeRhs rhs = [](realtype /*t*/, const ConstVectorMap& y, VectorMap& dy_dt) {
        dy_dt = y.array().square().matrix();
    };
    SolverOptions options;
    options.max_steps = 20000;
    Solver solver(rhs, scalar(1.0), 0.0, 2.0, options);
    TimeSeriesObserver observer(0.0, 2.0, 21, 1);

    REQUIRE_THROWS_AS(solver.solve(observer), IntegrationError);
    REQUIRE_FALSE(observer.complete());
}

TEST_CASE("Exhausted step budget raises IntegrationError", "[solver][errors]") {
    const OdeRhs rhs = exponential(-1.0);
    SolverOptions options;
    options.max_steps = 10;
    Solver solver(rhs, scalar(1.0), 0.0, 1000.0, options);
    TimeSeriesObserver observer(0.0, 1000.0, 2, 1);

    REQUIRE_THROWS_AS(solver.solve(observer), IntegrationError);
}

TEST_CASE("Exceptions of the right-hand side reach the caller unchanged", "[solver][errors]") {
    const OdeRhs rhs = [](realtype t, const ConstVectorMap& y, VectorMap& dy_dt) {
        if (t > 0.5) throw DomainError("undefined beyond t = 0.5");
        dy_dt = -y;
    };

    SECTION("ERK") {
        Solver solver(rhs, scalar(1.0), 0.0, 1.0);
        TimeSeriesObserver observer(0.0, 1.0, 5, 1);
        REQUIRE_THROWS_AS(solver.solve(observer), DomainError);
    }
    SECTION("BDF") {
        SolverOptions options;
        options.solverType = SolverType::BDF;
        Solver solver(rhs, scalar(1.0), 0.0, 1.0, options);
        TimeSeriesObserver observer(0.0, 1.0, 5, 1);
        REQUIRE_THROWS_WITH(solver.solve(observer), "undefined beyond t = 0.5");
    }
}

TEST_CASE("Non-finite derivatives raise IntegrationError", "[solver][errors]") {
    const OdeRhs rhs = [](realtype /*t*/, const ConstVectorMap& y, VectorMap& dy_dt) {
        dy_dt = y / 0.0;
    };
    Solver solver(rhs, scalar(1.0), 0.0, 1.0);
    TimeSeriesObserver observer(0.0, 1.0, 5, 1);
    REQUIRE_THROWS_AS(solver.solve(observer), IntegrationError);
}

TEST_CASE("BDF solver", "[solver][bdf]") {
    SolverOptions options;
    options.solverType = SolverType::BDF;

    SECTION("exponential decay") {
        const OdeRhs rhs = exponential(-0.5);
        Solver solver(rhs, scalar(4.0), 0.0, 6.0, options);
        TimeSeriesObserver observer(0.0, 6.0, 13, 1);
        solver.solve(observer);
        for (std::size_t i = 0; i < observer.n_samples(); ++i) {
            const realtype t = observer.t_desired(i);
            REQUIRE(observer.getSamples()(static_cast<Eigen::Index>(i), 0) ==
                    Approx(4.0 * std::exp(-0.5 * t)).epsilon(1e-3).margin(1e-6));
        }
    }
    SECTION("stiff linear system") {
        // fast mode decays with rate 1000, slow mode with rate 1
        const OdeRhs rhs = [](realtype /*t*/, const ConstVectorMap& y, VectorMap& dy_dt) {
            dy_dt(0) = -1000.0 * y(0);
            dy_dt(1) = -y(1);
        };
        Vector y0(2);
        y0 << 1.0, 1.0;
        Solver solver(rhs, y0, 0.0, 2.0, options);
        TimeSeriesObserver observer(0.0, 2.0, 3, 2);
        solver.solve(observer);
        REQUIRE(observer.getSamples()(2, 0) == Approx(0.0).margin(1e-6));
        REQUIRE(observer.getSamples()(2, 1) == Approx(std::exp(-2.0)).epsilon(1e-3));
    }
}

TEST_CASE("Invalid solver setup", "[solver][errors]") {
    const OdeRhs rhs = exponential(1.0);
    REQUIRE_THROWS_AS(Solver(rhs, scalar(1.0), 1.0, 1.0), ConfigurationError);
    REQUIRE_THROWS_AS(Solver(rhs, Vector(0), 0.0, 1.0), ConfigurationError);

    Solver solver(rhs, scalar(1.0), 0.0, 1.0);
    TimeSeriesObserver wrong_states(0.0, 1.0, 3, 2);
    REQUIRE_THROWS_AS(solver.solve(wrong_states), ConfigurationError);
    TimeSeriesObserver beyond_span(0.0, 2.0, 3, 1);
    REQUIRE_THROWS_AS(solver.solve(beyond_span), ConfigurationError);
}

TEST_CASE("SundialsIntegrator fills the observer", "[solver]") {
    const SundialsIntegrator integrator;
    const OdeRhs rhs = exponential(-2.0);
    TimeSeriesObserver observer(0.0, 1.0, 11, 1);
    integrator.integrate(rhs, scalar(1.0), observer);

    REQUIRE(observer.complete());
    REQUIRE(observer.getSamples()(10, 0) == Approx(std::exp(-2.0)).epsilon(1e-4));
}
