#include "Trajectory.hpp"

#include <string>

#include "Errors.hpp"

Trajectory Trajectory::fromObserver(const TimeSeriesObserver& observer) {
    if (!observer.complete() || observer.n_states() != StateVector::SIZE) {
        throw IntegrationError("Observer holds " + std::to_string(observer.n_written()) + " of " +
                               std::to_string(observer.n_samples()) + " samples with " +
                               std::to_string(observer.n_states()) + " states, expected a complete [S, B, G] series");
    }
    const Array& samples = observer.getSamples();
    return Trajectory{observer.getTimes(), samples.col(StateVector::S_IDX), samples.col(StateVector::B_IDX),
                      samples.col(StateVector::G_IDX)};
}
