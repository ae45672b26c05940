#include <catch2/catch.hpp>

#include <stdexcept>

#include "Errors.hpp"
#include "Observers/TimeSeriesObserver.hpp"

TEST_CASE("Output grid", "[observer]") {
    const TimeSeriesObserver observer(0.0, 50.0, 300, 3);
    REQUIRE(observer.n_samples() == 300);
    REQUIRE(observer.n_states() == 3);
    REQUIRE(observer.t_start() == 0.0);
    REQUIRE(observer.t_end() == 50.0);
    REQUIRE(observer.t_desired(1) == Approx(50.0 / 299.0));

    for (std::size_t i = 1; i < observer.n_samples(); ++i) {
        REQUIRE(observer.t_desired(i) > observer.t_desired(i - 1));
    }

    const TimeSeriesObserver two_points(-1.0, 0.1, 2, 1);
    REQUIRE(two_points.t_desired(0) == -1.0);
    REQUIRE(two_points.t_desired(1) == 0.1);
}

TEST_CASE("Writing samples", "[observer]") {
    TimeSeriesObserver observer(0.0, 1.0, 3, 2);
    const realtype first[] = {1.0, 2.0};
    const realtype second[] = {3.0, 4.0};
    const realtype third[] = {5.0, 6.0};

    SECTION("in order") {
        observer.write(0, 0.0, first);
        REQUIRE_FALSE(observer.complete());
        observer.write(1, 0.5, second);
        observer.write(2, 1.0, third);
        REQUIRE(observer.complete());
        REQUIRE(observer.getSamples()(1, 0) == 3.0);
        REQUIRE(observer.getSamples()(2, 1) == 6.0);
        REQUIRE(observer.getSamples()(0, 1) == 2.0);
    }
    SECTION("out of order") {
        observer.write(0, 0.0, first);
        REQUIRE_THROWS_AS(observer.write(2, 1.0, third), std::logic_error);
        REQUIRE(observer.n_written() == 1);
    }
}

TEST_CASE("Invalid grids", "[observer][errors]") {
    REQUIRE_THROWS_AS(TimeSeriesObserver(0.0, 1.0, 1, 3), ConfigurationError);
    REQUIRE_THROWS_AS(TimeSeriesObserver(1.0, 1.0, 10, 3), ConfigurationError);
    REQUIRE_THROWS_AS(TimeSeriesObserver(0.0, 1.0, 10, 0), ConfigurationError);
}
