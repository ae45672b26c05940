#include <arkode/arkode_erkstep.h>
#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>

#include <cmath>
#include <iomanip>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Errors.hpp"
#include "Logger.hpp"
#include "Solver.hpp"

bool Solver::checkTimeout() const {
    auto elapsed = std::chrono::steady_clock::now() - t_solve_start;
    elapsed_seconds = std::chrono::duration<realtype>(elapsed).count();
    return elapsed_seconds >= options.timeout_seconds;
}

void Solver::fail(int flag, const std::string& funcname) {
    logStatistics();
    logger::flush_all_logs();
    if (rhs_exception) {
        // e.g. DomainError from a rate law: hand it to the caller unchanged
        std::exception_ptr captured = rhs_exception;
        rhs_exception = nullptr;
        std::rethrow_exception(captured);
    }
    std::ostringstream oss;
    oss << funcname << " failed with flag = " << flag << " at t=" << t << " after " << n_steps << " steps";
    if (flag == ARK_ERR_FAILURE || flag == CV_ERR_FAILURE) {
        oss << " (error test failed repeatedly or step size fell below the minimum)";
    } else if (flag == ARK_TOO_MUCH_WORK || flag == CV_TOO_MUCH_WORK) {
        oss << " (step budget exhausted)";
    } else if (flag == ARK_TOO_MUCH_ACC || flag == CV_TOO_MUCH_ACC) {
        oss << " (requested accuracy not achievable)";
    }
    throw IntegrationError(oss.str());
}

int Solver::run_solver(realtype t_out) {
    int flag = 0;
    if (internal_time_stamps.empty()) internal_time_stamps.push_back(t);

    while (t < t_out) {
        realtype t_step = 0.0;  // BENCHMARK measures seconds
        BENCHMARK(t_step, {
            if (options.solverType == SolverType::ERK) {
                flag = ERKStepEvolve(solver_memory, t_stop, y, &t, ARK_ONE_STEP);
            } else {
                flag = CVode(solver_memory, t_stop, y, &t, CV_ONE_STEP);
            }
        });
        LOG_BENCHMARK("solver_step.log", std::scientific << std::setprecision(6) << "step=" << (n_steps + 1)
                                                         << "\t\tt=" << t << "\t\tt_step=" << t_step << "\n");

        if (flag < 0) {
            fail(flag, options.solverType == SolverType::ERK ? "ERKStepEvolve" : "CVode");
        }

        n_steps++;
        internal_time_stamps.push_back(t);

        if (n_steps >= options.max_steps && t < t_stop) {
            logStatistics();
            logger::flush_all_logs();
            throw IntegrationError("Maximum number of steps (" + std::to_string(options.max_steps) +
                                   ") exceeded at t=" + std::to_string(t) + ".");
        }
        steps_since_timeout_check++;
        if (steps_since_timeout_check >= timeout_check_interval) {
            if (checkTimeout()) {
                logStatistics();
                logger::flush_all_logs();
                throw IntegrationError("Solver timed out after " + std::to_string(elapsed_seconds) + " seconds.");
            }
            steps_since_timeout_check = 0;
        }
    }
    return flag;
}

void Solver::interpolate(realtype t_out) {
    int flag = 0;
    if (options.solverType == SolverType::ERK) {
        flag = ERKStepGetDky(solver_memory, t_out, 0, y_sample);
    } else {
        flag = CVodeGetDky(solver_memory, t_out, 0, y_sample);
    }
    CHECK_SUNDIALS_FLAG(flag, "GetDky");
}

void Solver::solve(TimeSeriesObserver& observer) {
    // Initialize timeout tracking
    this->t_solve_start = std::chrono::steady_clock::now();
    this->steps_since_timeout_check = 0;

    if (observer.n_states() != ySize) {
        throw ConfigurationError("Observer expects " + std::to_string(observer.n_states()) + " states, solver has " +
                                 std::to_string(ySize));
    }
    if (observer.t_start() != t || observer.t_end() > t_stop) {
        throw ConfigurationError("Observer time grid [" + std::to_string(observer.t_start()) + ", " +
                                 std::to_string(observer.t_end()) + "] lies outside the solver span [" +
                                 std::to_string(t) + ", " + std::to_string(t_stop) + "]");
    }

    // Initial state is sampled as given
    observer.write(0, t, N_VGetArrayPointer(y));

    for (std::size_t i = 1; i < observer.n_samples(); ++i) {
        const realtype t_out = observer.t_desired(i);
        run_solver(t_out);

        if (t == t_out) {
            observer.write(i, t, N_VGetArrayPointer(y));
        } else {
            // t_out lies within the last step -> dense output
            interpolate(t_out);
            observer.write(i, t_out, N_VGetArrayPointer(y_sample));
        }
    }

    checkTimeout();
    logStatistics();
    LOG("solver_statistics.log", "Solve finished in " << elapsed_seconds << " s with " << n_steps
                                                      << " internal steps for " << observer.n_samples()
                                                      << " samples\n");
}

SolverStatistics Solver::getStatistics() const {
    SolverStatistics stats;
    int flag = 0;
    if (options.solverType == SolverType::ERK) {
        flag = ERKStepGetNumSteps(solver_memory, &stats.n_steps);
        CHECK_SUNDIALS_FLAG(flag, "ERKStepGetNumSteps");
        flag = ERKStepGetNumRhsEvals(solver_memory, &stats.n_rhs_evals);
        CHECK_SUNDIALS_FLAG(flag, "ERKStepGetNumRhsEvals");
        flag = ERKStepGetNumErrTestFails(solver_memory, &stats.n_err_test_fails);
        CHECK_SUNDIALS_FLAG(flag, "ERKStepGetNumErrTestFails");
        flag = ERKStepGetLastStep(solver_memory, &stats.last_step);
        CHECK_SUNDIALS_FLAG(flag, "ERKStepGetLastStep");
    } else {
        flag = CVodeGetNumSteps(solver_memory, &stats.n_steps);
        CHECK_SUNDIALS_FLAG(flag, "CVodeGetNumSteps");
        flag = CVodeGetNumRhsEvals(solver_memory, &stats.n_rhs_evals);
        CHECK_SUNDIALS_FLAG(flag, "CVodeGetNumRhsEvals");
        flag = CVodeGetNumErrTestFails(solver_memory, &stats.n_err_test_fails);
        CHECK_SUNDIALS_FLAG(flag, "CVodeGetNumErrTestFails");
        flag = CVodeGetLastStep(solver_memory, &stats.last_step);
        CHECK_SUNDIALS_FLAG(flag, "CVodeGetLastStep");
    }
    return stats;
}

void Solver::logStatistics() const {
#if LOG_ENABLED
    const SolverStatistics stats = getStatistics();

    std::ostringstream oss;
    oss << std::setprecision(6);
    oss << "nsteps=" << stats.n_steps << "  ";
    oss << "nfevals=" << stats.n_rhs_evals << "  ";
    oss << "errtestfails=" << stats.n_err_test_fails << "  ";
    oss << "last_h=" << std::scientific << stats.last_step << "  ";

    if (options.solverType == SolverType::BDF) {
        long int nniters = 0, nnconvfails = 0, njacevals = 0;
        int qlast = 0;
        if (CVodeGetNumNonlinSolvIters(solver_memory, &nniters) == CV_SUCCESS) {
            oss << "nonlinIters=" << nniters << "  ";
        }
        if (CVodeGetNumNonlinSolvConvFails(solver_memory, &nnconvfails) == CV_SUCCESS) {
            oss << "nonlinConvFails=" << nnconvfails << "  ";
        }
        if (CVodeGetNumJacEvals(solver_memory, &njacevals) == CV_SUCCESS) {
            oss << "JacEvals=" << njacevals << "  ";
        }
        if (CVodeGetLastOrder(solver_memory, &qlast) == CV_SUCCESS) oss << "last_order=" << qlast << "  ";
    } else {
        long int nconstrfails = 0;
        if (ERKStepGetNumConstrFails(solver_memory, &nconstrfails) == ARK_SUCCESS) {
            oss << "constrFails=" << nconstrfails << "  ";
        }
    }
    oss << "tcur=" << t << "\n";

    LOG("solver_statistics.log", oss.str());
#endif
}
