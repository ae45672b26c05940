#include <catch2/catch.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Observers/NumpyIO.hpp"
#include "Trajectory.hpp"
#include "cnpy.h"

TEST_CASE("Trajectory export to npz", "[numpy-io]") {
    Trajectory trajectory;
    trajectory.t = ColVector::LinSpaced(4, 0.0, 3.0);
    trajectory.S = ColVector::Constant(4, 100.0) - trajectory.t;
    trajectory.B = ColVector::Constant(4, 1.0) + 0.3 * trajectory.t;
    trajectory.G = 0.7 * trajectory.t;

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "adsim_test_trajectory.npz";
    ADSim::save_trajectory_to_npz(trajectory, path.string());

    cnpy::npz_t archive = cnpy::npz_load(path.string());
    for (const std::string name : {"t", "S", "B", "G"}) {
        INFO(name);
        REQUIRE(archive.count(name) == 1);
        REQUIRE(archive[name].shape == std::vector<size_t>{4});
    }

    const double* S = archive["S"].data<double>();
    const double* G = archive["G"].data<double>();
    REQUIRE(S[0] == 100.0);
    REQUIRE(S[3] == 97.0);
    REQUIRE(G[3] == Approx(2.1));

    std::filesystem::remove(path);
}

TEST_CASE("Empty trajectories are not exported", "[numpy-io][errors]") {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "adsim_test_empty.npz";
    REQUIRE_THROWS_AS(ADSim::save_trajectory_to_npz(Trajectory{}, path.string()), ConfigurationError);
}
