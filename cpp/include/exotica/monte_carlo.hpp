#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace exotica::montecarlo {

// =============================================================================
// SIMULATION GRID
// Dense (num_steps + 1) x num_paths matrix of spot prices, stored time-major
// so that one exercise date is a contiguous row.
// =============================================================================

class SimulationGrid {
public:
    SimulationGrid() = default;
    SimulationGrid(size_t num_steps, size_t num_paths, double fill = 0.0)
        : num_steps_(num_steps),
          num_paths_(num_paths),
          data_((num_steps + 1) * num_paths, fill) {}

    [[nodiscard]] double& operator()(size_t step, size_t path) noexcept {
        return data_[index(step, path)];
    }

    [[nodiscard]] double operator()(size_t step, size_t path) const noexcept {
        return data_[index(step, path)];
    }

    [[nodiscard]] std::span<double> row(size_t step) noexcept {
        return {data_.data() + step * num_paths_, num_paths_};
    }

    [[nodiscard]] std::span<const double> row(size_t step) const noexcept {
        return {data_.data() + step * num_paths_, num_paths_};
    }

    [[nodiscard]] size_t num_steps() const noexcept { return num_steps_; }
    [[nodiscard]] size_t num_paths() const noexcept { return num_paths_; }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

private:
    size_t num_steps_{0};
    size_t num_paths_{0};
    std::vector<double> data_;

    [[nodiscard]] inline size_t index(size_t step, size_t path) const noexcept {
        return step * num_paths_ + path;
    }
};

// Simulation parameters
struct SimulationParams {
    double S0;           // Initial price
    double mu;           // Risk-neutral growth rate (rate minus yield)
    double sigma;        // Volatility
    double T;            // Time horizon (years)
    size_t num_steps;    // Number of time steps
    size_t num_paths;    // Number of simulation paths
    uint64_t seed;       // Random seed
};

/**
 * Geometric Brownian motion on a fixed grid:
 *   S[0, p] = S0
 *   S[t, p] = S0 * exp(z_0 + z_1 + ... + z_t),  z ~ N((mu - sigma^2/2) dt, sigma sqrt(dt))
 *
 * z_0 is drawn for every path and carried into all later steps, so
 * log(S[t] / S0) has variance (t + 1) sigma^2 dt.
 *
 * Every call seeds its own std::mt19937_64 from params.seed, and draws are
 * taken time-major, so identical params reproduce an identical grid.
 * Throws ValidationError on zero steps/paths or non-finite inputs.
 */
[[nodiscard]] SimulationGrid simulate_gbm_grid(const SimulationParams& params);

} // namespace exotica::montecarlo
