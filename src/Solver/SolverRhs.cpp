#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>

#include <exception>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>

#include "EigenDataTypes.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Solver.hpp"

int Solver::rhs(realtype t, N_Vector y_sundials, N_Vector dy_dt_sundials, void* user_data) {
    // CAREFUL: This function is static, so it cannot access non-static members directly.

    Solver* solver = static_cast<Solver*>(user_data);
    ConstVectorMap y(N_VGetArrayPointer(y_sundials), solver->ySize);
    VectorMap dy_dt(N_VGetArrayPointer(dy_dt_sundials), solver->ySize);

    // Zero-initialize dy_dt before the model writes its contributions
    dy_dt.setZero();

    // Exceptions must not unwind through SUNDIALS: keep them for fail() and abort the step
    try {
        realtype t_rhs = 0.0;
        BENCHMARK(t_rhs, { solver->odeRhs(t, y, dy_dt); });
        LOG_BENCHMARK("rhs.log", std::scientific << std::setprecision(6) << "t=" << t << "\t\tt_rhs=" << t_rhs << "\n");

        if (!dy_dt.allFinite()) {
            std::ostringstream oss;
            oss << "y or dy_dt contains NaN or Inf at t=" << t << ": y=[" << y.transpose() << "], dy_dt=["
                << dy_dt.transpose() << "]";
            throw IntegrationError(oss.str());
        }
    } catch (...) {
        solver->rhs_exception = std::current_exception();
        return -1;  // unrecoverable
    }

#if LOG_ENABLED
    auto& call_count = solver->rhs_call_count;
    ++call_count;
    if (call_count < LOG_FIRST_N_CALLS || call_count % LOG_EVERY_N_CALLS == 0) {
        std::ostringstream oss;
        oss.precision(4);
        oss << std::scientific;
        oss << call_count << ". rhs function call at t = " << t << "\n";
        oss << "\ty     = " << y.transpose() << "\n";
        oss << "\tdy_dt = " << dy_dt.transpose() << "\n";
        LOG("rhs.log", oss.str());
    }
#endif

    return 0;
}
