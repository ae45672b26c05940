#include "Observers/TimeSeriesObserver.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>

#include "Errors.hpp"
#include "Logger.hpp"

TimeSeriesObserver::TimeSeriesObserver(const realtype t_start,
                                       const realtype t_end,
                                       const std::size_t n_samples,
                                       const Eigen::Index n_states) {
    if (n_samples < 2) {
        throw ConfigurationError("TimeSeriesObserver must contain 2 or more samples.");
    }
    if (!(t_end > t_start)) {
        throw ConfigurationError("TimeSeriesObserver requires t_start < t_end.");
    }
    if (n_states < 1) {
        throw ConfigurationError("TimeSeriesObserver requires at least one state.");
    }

    const auto n = static_cast<Eigen::Index>(n_samples);
    times.resize(n);
    samples = Array::Zero(n, n_states);

    // Last time point set explicitly so the grid ends exactly at t_end
    realtype step = (t_end - t_start) / static_cast<realtype>(n_samples - 1);
    for (Eigen::Index i = 0; i < n - 1; ++i) {
        times(i) = t_start + step * static_cast<realtype>(i);
    }
    times(n - 1) = t_end;
}

void TimeSeriesObserver::write(std::size_t sample_idx, realtype t, const realtype* y) {
    if (sample_idx != written) {
        throw std::logic_error("TimeSeriesObserver samples must be written in order (expected index " +
                               std::to_string(written) + ", got " + std::to_string(sample_idx) + ")");
    }
    const auto i = static_cast<Eigen::Index>(sample_idx);
    samples.row(i) = Eigen::Map<const RowVector>(y, samples.cols());
    ++written;

    LOG("time_series_observer.log", "Sample " << sample_idx << " at t_desired=" << times(i) << " (t=" << t
                                              << "): " << samples.row(i) << "\n");
}
