#ifndef TIMESERIESOBSERVER_HPP
#define TIMESERIESOBSERVER_HPP

#include <cstddef>

#include "EigenDataTypes.hpp"
#include "sundials/sundials_types.h"

/**
 * @brief Records the solution on a linearly spaced output grid
 *
 * Holds n_samples time points in [t_start, t_end] (both endpoints exact) and
 * one row of n_states values per time point. The integrator fills the rows in
 * order of increasing time.
 */
class TimeSeriesObserver {
   public:
    TimeSeriesObserver(const realtype t_start,
                       const realtype t_end,
                       const std::size_t n_samples,
                       const Eigen::Index n_states);

    void write(std::size_t sample_idx, realtype t, const realtype* y);

    realtype t_desired(std::size_t sample_idx) const { return times(static_cast<Eigen::Index>(sample_idx)); }
    realtype t_start() const { return times(0); }
    realtype t_end() const { return times(times.size() - 1); }

    std::size_t n_samples() const { return static_cast<std::size_t>(times.size()); }
    Eigen::Index n_states() const { return samples.cols(); }
    std::size_t n_written() const { return written; }
    bool complete() const { return written == n_samples(); }

    const ColVector& getTimes() const { return times; }
    const Array& getSamples() const { return samples; }

   private:
    ColVector times;
    Array samples;
    std::size_t written = 0;
};

#endif  // TIMESERIESOBSERVER_HPP
