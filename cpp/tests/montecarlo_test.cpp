#include <gtest/gtest.h>
#include "exotica/monte_carlo.hpp"
#include "exotica/pricing_error.hpp"
#include <cmath>
#include <numeric>

using namespace exotica;
using namespace exotica::montecarlo;

TEST(MonteCarloTest, GridShape) {
    SimulationParams params{
        .S0 = 100.0,
        .mu = 0.05,
        .sigma = 0.25,
        .T = 1.0,
        .num_steps = 12,
        .num_paths = 1000,
        .seed = 42
    };

    auto grid = simulate_gbm_grid(params);

    EXPECT_EQ(grid.num_steps(), 12u);
    EXPECT_EQ(grid.num_paths(), 1000u);
    EXPECT_EQ(grid.row(12).size(), 1000u);
    for (double s : grid.row(0)) {
        EXPECT_EQ(s, 100.0);
    }
    for (size_t t = 1; t <= 12; ++t) {
        for (double s : grid.row(t)) {
            EXPECT_GT(s, 0.0);
        }
    }
}

TEST(MonteCarloTest, ReproducibleForSeed) {
    SimulationParams params{
        .S0 = 100.0,
        .mu = 0.05,
        .sigma = 0.25,
        .T = 1.0,
        .num_steps = 10,
        .num_paths = 500,
        .seed = 7
    };

    auto first = simulate_gbm_grid(params);
    auto second = simulate_gbm_grid(params);

    for (size_t t = 0; t <= 10; ++t) {
        for (size_t p = 0; p < 500; ++p) {
            ASSERT_EQ(first(t, p), second(t, p));
        }
    }

    params.seed = 8;
    auto other = simulate_gbm_grid(params);
    EXPECT_NE(first(10, 0), other(10, 0));
}

TEST(MonteCarloTest, ExpectedTerminalPrice) {
    SimulationParams params{
        .S0 = 100.0,
        .mu = 0.10,  // 10% growth
        .sigma = 0.25,
        .T = 1.0,
        .num_steps = 50,
        .num_paths = 20000,
        .seed = 123
    };

    auto grid = simulate_gbm_grid(params);
    const auto terminal = grid.row(params.num_steps);
    const double mean = std::accumulate(terminal.begin(), terminal.end(), 0.0) / terminal.size();

    // The initial draw adds one step of growth: S0 * e^(mu*(T + dt))
    const double dt = params.T / params.num_steps;
    double expected = params.S0 * std::exp(params.mu * (params.T + dt));
    double tolerance = expected * 0.02;

    EXPECT_NEAR(mean, expected, tolerance);
}

TEST(MonteCarloTest, InitialDrawCarriesIntoFirstStep) {
    SimulationParams params{
        .S0 = 100.0,
        .mu = 0.0,
        .sigma = 0.25,
        .T = 2.0,
        .num_steps = 4,
        .num_paths = 200000,
        .seed = 2024
    };

    auto grid = simulate_gbm_grid(params);
    const double dt = params.T / params.num_steps;

    auto log_variance = [&](size_t step) {
        const auto row = grid.row(step);
        double sum = 0.0, sum_sq = 0.0;
        for (double s : row) {
            const double x = std::log(s / params.S0);
            sum += x;
            sum_sq += x * x;
        }
        const double n = static_cast<double>(row.size());
        const double mean = sum / n;
        return (sum_sq - n * mean * mean) / (n - 1.0);
    };

    // Step t carries t + 1 draws: variance (t + 1) sigma^2 dt
    EXPECT_NEAR(log_variance(1), 2.0 * 0.25 * 0.25 * dt, 0.002);
    EXPECT_NEAR(log_variance(4), 5.0 * 0.25 * 0.25 * dt, 0.004);

    for (double s : grid.row(0)) {
        ASSERT_EQ(s, 100.0);
    }
}

TEST(MonteCarloTest, ZeroVolatilityIsDeterministic) {
    SimulationParams params{
        .S0 = 50.0,
        .mu = 0.04,
        .sigma = 0.0,
        .T = 2.0,
        .num_steps = 4,
        .num_paths = 3,
        .seed = 1
    };

    auto grid = simulate_gbm_grid(params);

    for (size_t p = 0; p < 3; ++p) {
        EXPECT_EQ(grid(0, p), 50.0);
        // Five deterministic increments of dt = 0.5 reach step 4
        EXPECT_NEAR(grid(4, p), 50.0 * std::exp(0.04 * 2.5), 1e-10);
    }
}

TEST(MonteCarloTest, RejectsInvalidParameters) {
    SimulationParams params{
        .S0 = 100.0,
        .mu = 0.05,
        .sigma = 0.25,
        .T = 1.0,
        .num_steps = 10,
        .num_paths = 100,
        .seed = 1
    };

    auto no_paths = params;
    no_paths.num_paths = 0;
    EXPECT_THROW((void)simulate_gbm_grid(no_paths), ValidationError);

    auto no_steps = params;
    no_steps.num_steps = 0;
    EXPECT_THROW((void)simulate_gbm_grid(no_steps), ValidationError);

    auto negative_vol = params;
    negative_vol.sigma = -0.1;
    EXPECT_THROW((void)simulate_gbm_grid(negative_vol), ValidationError);

    auto not_finite = params;
    not_finite.S0 = std::nan("");
    EXPECT_THROW((void)simulate_gbm_grid(not_finite), ValidationError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
