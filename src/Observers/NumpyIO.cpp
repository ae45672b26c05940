/**
 * @file NumpyIO.cpp
 * @brief Implementation of NumPy I/O wrapper functions
 */

#include "Observers/NumpyIO.hpp"

#include "Errors.hpp"
#include "Logger.hpp"
#include "cnpy.h"

namespace ADSim {

template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode) {
    cnpy::npz_save(zipname, varname, data, shape, mode);
}

void save_trajectory_to_npz(const Trajectory& trajectory, const std::string& zipname, const std::string& mode) {
    const size_t n = trajectory.size();
    if (n == 0) {
        throw ConfigurationError("Cannot save an empty trajectory to " + zipname);
    }
    if (static_cast<size_t>(trajectory.S.size()) != n || static_cast<size_t>(trajectory.B.size()) != n ||
        static_cast<size_t>(trajectory.G.size()) != n) {
        throw ConfigurationError("Trajectory columns differ in length, refusing to save to " + zipname);
    }

    // ColVector is contiguous, so each column goes out as a 1-D array
    npz_save(zipname, "t", trajectory.t.data(), {n}, mode);
    npz_save(zipname, "S", trajectory.S.data(), {n}, "a");
    npz_save(zipname, "B", trajectory.B.data(), {n}, "a");
    npz_save(zipname, "G", trajectory.G.data(), {n}, "a");

    LOG("numpy_io.log", "Saved trajectory with " << n << " samples to " << zipname << "\n");
}

template void npz_save<double>(const std::string&,
                               const std::string&,
                               const double*,
                               const std::vector<size_t>&,
                               const std::string&);

}  // namespace ADSim
