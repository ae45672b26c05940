#include <arkode/arkode_erkstep.h>
#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>
#include <sunlinsol/sunlinsol_dense.h>
#include <sunmatrix/sunmatrix_dense.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "EigenDataTypes.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Solver.hpp"

Solver::Solver(const OdeRhs& odeRhs,
               const Vector& y0,
               realtype t_start,
               realtype t_stop,
               const SolverOptions& options)
    : odeRhs(odeRhs), options(options), t(t_start), t_stop(t_stop), ySize(static_cast<sunindextype>(y0.size())) {
    if (!(t_stop > t_start)) {
        throw ConfigurationError("Solver requires t_start < t_stop (got " + std::to_string(t_start) + ", " +
                                 std::to_string(t_stop) + ")");
    }
    if (ySize == 0) {
        throw ConfigurationError("Solver requires a non-empty initial state.");
    }

    // h_min derived from the time span unless set explicitly
    const realtype min_step = options.min_step > 0.0 ? options.min_step : 1e-12 * (t_stop - t_start);

    try {
        // Create Sundials context (must be first)
        int flag = SUNContext_Create(nullptr, &sunctx);
        CHECK_SUNDIALS_FLAG(flag, "SUNContext_Create");

        // Allocate solution vector and copy the initial state
        y = N_VNew_Serial(ySize, sunctx);
        y_sample = N_VNew_Serial(ySize, sunctx);
        if (!y || !y_sample) {
            throw IntegrationError("Failed to allocate N_Vector y");
        }
        realtype* y_data = N_VGetArrayPointer(y);
        std::copy(y0.data(), y0.data() + ySize, y_data);

        if (options.use_sundials_non_negative_constraint) {
            constraints = N_VNew_Serial(ySize, sunctx);
            if (!constraints) {
                throw IntegrationError("Failed to allocate N_Vector constraints");
            }
            // 1.0 => enforce y[i] >= 0.0
            N_VConst(1.0, constraints);
        }

        if (options.solverType == SolverType::ERK) {
            solver_memory = ERKStepCreate(rhs, t, y, sunctx);
            if (!solver_memory) {
                throw IntegrationError("Failed to create ERKStep solver");
            }

            flag = ERKStepSetTableNum(solver_memory, ARKODE_DORMAND_PRINCE_7_4_5);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetTableNum");

            flag = ERKStepSStolerances(solver_memory, options.reltol, options.abstol);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSStolerances");

            flag = ERKStepSetUserData(solver_memory, this);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetUserData");

            flag = ERKStepSetMaxNumSteps(solver_memory, options.max_steps);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetMaxNumSteps");

            // Never step past the end of the time span
            flag = ERKStepSetStopTime(solver_memory, t_stop);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetStopTime");

            flag = ERKStepSetMinStep(solver_memory, min_step);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetMinStep");
            if (options.max_step > 0.0) {
                flag = ERKStepSetMaxStep(solver_memory, options.max_step);
                CHECK_SUNDIALS_FLAG(flag, "ERKStepSetMaxStep");
            }
            if (options.init_step > 0.0) {
                flag = ERKStepSetInitStep(solver_memory, options.init_step);
                CHECK_SUNDIALS_FLAG(flag, "ERKStepSetInitStep");
            }
            flag = ERKStepSetMaxErrTestFails(solver_memory, options.max_err_test_fails);
            CHECK_SUNDIALS_FLAG(flag, "ERKStepSetMaxErrTestFails");

            if (constraints) {
                flag = ERKStepSetConstraints(solver_memory, constraints);
                CHECK_SUNDIALS_FLAG(flag, "ERKStepSetConstraints");
            }
            LOG("solver_initialization.log", "Created ERKStep solver (Dormand-Prince 7-4-5) with y_size " << ySize
                                                                                                        << "\n");

        } else if (options.solverType == SolverType::BDF) {
            solver_memory = CVodeCreate(CV_BDF, sunctx);
            if (!solver_memory) {
                throw IntegrationError("Failed to create CVODE BDF solver");
            }

            flag = CVodeInit(solver_memory, rhs, t, y);
            CHECK_SUNDIALS_FLAG(flag, "CVodeInit");

            flag = CVodeSStolerances(solver_memory, options.reltol, options.abstol);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSStolerances");

            // Newton iteration needs a linear solver; CVODE approximates the Jacobian by finite differences
            J = SUNDenseMatrix(ySize, ySize, sunctx);
            if (!J) {
                throw IntegrationError("Failed to create SUNDenseMatrix J");
            }
            lin_sol = SUNLinSol_Dense(y, J, sunctx);
            if (!lin_sol) {
                throw IntegrationError("Failed to create SUNLinSol_Dense linear solver");
            }
            flag = CVodeSetLinearSolver(solver_memory, lin_sol, J);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetLinearSolver");

            flag = CVodeSetMaxOrd(solver_memory, options.max_order_bdf);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxOrd");

            flag = CVodeSetUserData(solver_memory, this);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetUserData");

            flag = CVodeSetMaxNumSteps(solver_memory, options.max_steps);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxNumSteps");

            flag = CVodeSetStopTime(solver_memory, t_stop);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetStopTime");

            flag = CVodeSetMinStep(solver_memory, min_step);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMinStep");
            if (options.max_step > 0.0) {
                flag = CVodeSetMaxStep(solver_memory, options.max_step);
                CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxStep");
            }
            if (options.init_step > 0.0) {
                flag = CVodeSetInitStep(solver_memory, options.init_step);
                CHECK_SUNDIALS_FLAG(flag, "CVodeSetInitStep");
            }
            flag = CVodeSetMaxErrTestFails(solver_memory, options.max_err_test_fails);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxErrTestFails");

            if (constraints) {
                flag = CVodeSetConstraints(solver_memory, constraints);
                CHECK_SUNDIALS_FLAG(flag, "CVodeSetConstraints");
            }
            LOG("solver_initialization.log", "Created CVODE BDF solver with y_size " << ySize << "\n");

        } else {
            throw ConfigurationError("Unsupported SolverType");
        }
    } catch (...) {
        free_sundials_memory();
        throw;
    }

    LOG("solver_initialization.log", "t=[" << t << ", " << t_stop << "], reltol=" << options.reltol
                                           << ", abstol=" << options.abstol << ", h_min=" << min_step
                                           << ", max_steps=" << options.max_steps << "\n");
}

// Destructor cleans up all allocated Sundials objects
Solver::~Solver() { free_sundials_memory(); }

void Solver::free_sundials_memory() {
    if (solver_memory && options.solverType == SolverType::BDF) CVodeFree(&solver_memory);
    if (solver_memory && options.solverType == SolverType::ERK) ERKStepFree(&solver_memory);

    if (y) N_VDestroy(y);
    if (y_sample) N_VDestroy(y_sample);
    if (constraints) N_VDestroy(constraints);
    if (J) SUNMatDestroy(J);
    if (lin_sol) SUNLinSolFree(lin_sol);
    if (sunctx) SUNContext_Free(&sunctx);

    solver_memory = nullptr;
    y = y_sample = constraints = nullptr;
    J = nullptr;
    lin_sol = nullptr;
}

const std::vector<realtype> Solver::getY() const {
    const realtype* y_data = N_VGetArrayPointer(y);
    return std::vector<realtype>(y_data, y_data + ySize);
}

void SundialsIntegrator::integrate(const OdeRhs& rhs, const Vector& y0, TimeSeriesObserver& observer) const {
    Solver solver(rhs, y0, observer.t_start(), observer.t_end(), options);
    solver.solve(observer);
}
