#ifndef STATE_VECTOR_HPP
#define STATE_VECTOR_HPP

#include <sundials/sundials_types.h>

#include "EigenDataTypes.hpp"

/**
 * @brief Reactor state at one time point
 *
 * S: substrate [g/L], B: biomass [g/L], G: cumulative biogas [g/L].
 * Layout in the solver's y vector is [S, B, G].
 */
struct StateVector {
    static constexpr Eigen::Index S_IDX = 0;
    static constexpr Eigen::Index B_IDX = 1;
    static constexpr Eigen::Index G_IDX = 2;
    static constexpr Eigen::Index SIZE = 3;

    realtype S = 0.0;
    realtype B = 0.0;
    realtype G = 0.0;

    Vector toVector() const {
        Vector y(SIZE);
        y << S, B, G;
        return y;
    }
};

#endif  // STATE_VECTOR_HPP
