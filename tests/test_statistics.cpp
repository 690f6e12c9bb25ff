#include <catch2/catch.hpp>
#include "analytics/statistics.hpp"
#include <stdexcept>

using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Population moments", "[Statistics]") {
    auto v = to_eigen({100.0, 100.0, 100.0, 100.0, 500.0});

    REQUIRE_THAT(mean(v), WithinAbs(180.0, 1e-12));
    REQUIRE_THAT(population_variance(v), WithinAbs(25600.0, 1e-9));
    REQUIRE_THAT(population_std_dev(v), WithinAbs(160.0, 1e-9));

    REQUIRE_THROWS_AS(mean(Eigen::VectorXd()), std::invalid_argument);
}

TEST_CASE("Least-squares slope", "[Statistics]") {
    SECTION("Linear series") {
        REQUIRE_THAT(ols_slope(to_eigen({1000.0, 1100.0, 1200.0})), WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(ols_slope(to_eigen({9.0, 7.0, 5.0, 3.0})), WithinAbs(-2.0, 1e-9));
    }

    SECTION("Noisy series") {
        // x = 0..3, y = 1, 3, 2, 4 -> slope 0.8
        REQUIRE_THAT(ols_slope(to_eigen({1.0, 3.0, 2.0, 4.0})), WithinAbs(0.8, 1e-9));
    }

    SECTION("Degenerate series") {
        REQUIRE(ols_slope(to_eigen({42.0})) == 0.0);
        REQUIRE(ols_slope(Eigen::VectorXd()) == 0.0);
        REQUIRE(ols_slope(to_eigen({5.0, 5.0, 5.0})) == 0.0);
    }
}

TEST_CASE("Division guard", "[Statistics]") {
    REQUIRE_THAT(safe_ratio(600.0, 500.0), WithinAbs(1.2, 1e-12));
    REQUIRE(safe_ratio(50.0, 0.0) == 0.0);
    REQUIRE(safe_ratio(50.0, 0.0, -1.0) == -1.0);

    REQUIRE(clamp(-21.2, 0.0, 100.0) == 0.0);
    REQUIRE(clamp(150.0, 0.0, 100.0) == 100.0);
    REQUIRE(clamp(42.0, 0.0, 100.0) == 42.0);
}
