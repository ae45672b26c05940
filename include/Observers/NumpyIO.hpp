/**
 * @file NumpyIO.hpp
 * @brief Save simulation results to NumPy .npz files
 *
 * Thin wrapper around cnpy plus a helper that writes a whole Trajectory
 * as the arrays t, S, B and G of one archive.
 */

#ifndef ADSIM_NUMPY_IO_HPP
#define ADSIM_NUMPY_IO_HPP

#include <string>
#include <vector>

#include "Trajectory.hpp"

namespace ADSim {

/**
 * @brief Save data as variable varname of a .npz archive
 *
 * @param mode "w" to overwrite/create, "a" to append variable to archive
 */
template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode = "w");

/**
 * @brief Save a trajectory as arrays t, S, B, G (each of length N)
 *
 * @example
 * Trajectory trajectory = simulate(defaultSimulationConfig(KineticsType::Monod));
 * ADSim::save_trajectory_to_npz(trajectory, logger::obs_dir() + "/monod.npz");
 */
void save_trajectory_to_npz(const Trajectory& trajectory, const std::string& zipname, const std::string& mode = "w");

}  // namespace ADSim

#endif  // ADSIM_NUMPY_IO_HPP
