#ifndef TRAJECTORY_HPP
#define TRAJECTORY_HPP

#include <cstddef>

#include "EigenDataTypes.hpp"
#include "Observers/TimeSeriesObserver.hpp"
#include "Reactor/StateVector.hpp"

/**
 * @brief Sampled result of one run
 *
 * t, S, B and G have equal length N with t(0) = t_start and t(N-1) = t_end.
 * Independent of the solver that produced it.
 */
struct Trajectory {
    ColVector t;
    ColVector S;
    ColVector B;
    ColVector G;

    std::size_t size() const { return static_cast<std::size_t>(t.size()); }

    StateVector at(std::size_t i) const {
        const auto idx = static_cast<Eigen::Index>(i);
        return StateVector{S(idx), B(idx), G(idx)};
    }

    // Columns of a completely written [S, B, G] observer
    static Trajectory fromObserver(const TimeSeriesObserver& observer);
};

#endif  // TRAJECTORY_HPP
