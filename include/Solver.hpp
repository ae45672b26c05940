#ifndef SOLVER_HPP
#define SOLVER_HPP

#include <arkode/arkode_erkstep.h>
#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>

#include <chrono>
#include <exception>
#include <limits>
#include <string>
#include <vector>

#include "EigenDataTypes.hpp"
#include "Errors.hpp"
#include "Integrator.hpp"
#include "Logger.hpp"
#include "Observers/TimeSeriesObserver.hpp"

/// @brief Available solver types for ODE integration
/// ERK: ARKode ERKStep with the Dormand-Prince 4(5) embedded pair (explicit, adaptive)
/// BDF: CVODE variable-order BDF with dense direct linear solver, for stiff parameter sets
enum class SolverType { ERK, BDF };

/**
 * @brief Tunable integration settings
 *
 * Defaults of SUNDIALS are noted where this differs from them.
 */
struct SolverOptions {
    SolverType solverType = SolverType::ERK;

    realtype reltol = 1e-6;
    realtype abstol = 1e-9;

    // h_min: minimum allowed step size. 0.0 means 1e-12 * (t_end - t_start). SUNDIALS default: 0.0 (no lower bound)
    realtype min_step = 0.0;
    // h_max: maximum allowed step size. SUNDIALS default: 0.0 (no upper bound)
    realtype max_step = 0.0;
    // Initial step size hint. SUNDIALS default: 0.0 (internally estimated)
    realtype init_step = 0.0;
    // Step budget for one run; exceeding it is an IntegrationError
    long int max_steps = 500000;
    // Error test failures allowed per step. SUNDIALS default: 7
    int max_err_test_fails = 20;
    // Max BDF order. SUNDIALS default: 5
    int max_order_bdf = 5;
    // Constraints (tells Sundials y >= 0 for all times)
    bool use_sundials_non_negative_constraint = true;
    // Wall-clock budget for one run; exceeding it is an IntegrationError
    realtype timeout_seconds = std::numeric_limits<realtype>::infinity();
};

/// @brief Counters of the last run, read from SUNDIALS
struct SolverStatistics {
    long int n_steps = 0;
    long int n_rhs_evals = 0;
    long int n_err_test_fails = 0;
    realtype last_step = 0.0;
};

/**
 * @brief SUNDIALS-based solver for a single run
 *
 * Owns the SUNDIALS context, integrator memory and vectors of one integration
 * from t_start to t_stop. Steps are chosen by the error controller alone; the
 * observer's sample times are served from the integrator's dense output.
 * Logs internal time stamps and statistics.
 */
class Solver {
   public:
    Solver(const OdeRhs& odeRhs,
           const Vector& y0,
           realtype t_start,
           realtype t_stop,
           const SolverOptions& options = SolverOptions());
    ~Solver();

    Solver(const Solver&) = delete;
    Solver& operator=(const Solver&) = delete;

    // Integrate to observer.t_end() and fill every sample of the observer
    void solve(TimeSeriesObserver& observer);

    // Take internal steps until t >= t_out
    int run_solver(realtype t_out);

    const std::vector<realtype> getY() const;
    realtype getT() const { return t; }
    const std::vector<realtype>& getInternalTimeStamps() const { return internal_time_stamps; }

    SolverStatistics getStatistics() const;
    void logStatistics() const;

    // Get the elapsed wall-clock time of the last solve() call in seconds
    realtype getSolveTime() const { return elapsed_seconds; }

   protected:
    // RHS function f(t,y) = y'
    static int rhs(realtype t, N_Vector y, N_Vector dy_dt, void* user_data);

    // Interpolate the solution at t_out from the last step into y_sample
    void interpolate(realtype t_out);

    // Throw the exception captured in rhs, or an IntegrationError for flag
    [[noreturn]] void fail(int flag, const std::string& funcname);

    bool checkTimeout() const;
    void free_sundials_memory();

    const OdeRhs& odeRhs;
    const SolverOptions options;

    // Sundials objects
    SUNContext sunctx = nullptr;
    void* solver_memory = nullptr;
    SUNMatrix J = nullptr;
    SUNLinearSolver lin_sol = nullptr;
    N_Vector constraints = nullptr;

    // State variables
    N_Vector y = nullptr;
    N_Vector y_sample = nullptr;
    realtype t;
    const realtype t_stop;
    sunindextype ySize;

    long int n_steps = 0;

    // Stores all internal time stamps chosen by Sundials during integration
    std::vector<realtype> internal_time_stamps;

    // Exception raised inside rhs; must not unwind through the C library
    std::exception_ptr rhs_exception;

    // Timeout functionality
    mutable std::chrono::steady_clock::time_point t_solve_start;
    mutable int timeout_check_interval = 100;  // Check timeout every N steps to avoid overhead
    mutable int steps_since_timeout_check = 0;
    mutable realtype elapsed_seconds = 0.0;  // Time elapsed since start of solve() in seconds

#if LOG_ENABLED
    int rhs_call_count = 0;
#endif
};

/**
 * @brief IntegratorBase backed by SUNDIALS
 *
 * Creates a fresh Solver per call, so one instance can serve concurrent runs.
 */
class SundialsIntegrator : public IntegratorBase {
   public:
    explicit SundialsIntegrator(const SolverOptions& options = SolverOptions()) : options(options) {}

    void integrate(const OdeRhs& rhs, const Vector& y0, TimeSeriesObserver& observer) const override;

   private:
    const SolverOptions options;
};

// Helper macro for error checking
#define CHECK_SUNDIALS_FLAG(flag, funcname)                                                                    \
    if ((flag) != CV_SUCCESS) {                                                                                \
        throw IntegrationError(std::string(funcname) + " failed with flag = " + std::to_string(flag));         \
    }

#endif  // SOLVER_HPP
